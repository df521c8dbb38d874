#include <cassert>
#include <iostream>
#include <string>

#include <juce_core/juce_core.h>

#include "RecordingBackend.h"
#include "core/Cue.h"
#include "core/CueError.h"
#include "core/FadeTime.h"
#include "core/Mixer.h"
#include "core/Project.h"
#include "core/ProjectBundle.h"
#include "core/ProjectDocument.h"
#include "core/ProjectSerialization.h"
#include "core/StringConversions.h"

// Project files: XML round trips, malformed input, file helpers, the
// document's save state and .cuemixz bundles.

using cuemix::CueAction;
using cuemix::CueError;
using cuemix::FadeTime;
using cuemix::FadeUnit;
using cuemix::Mixer;
using cuemix::Project;
using cuemix::ProjectDocument;

namespace {

juce::File MakeTempDirectory(const char* name)
{
    auto dir = juce::File::getSpecialLocation(juce::File::tempDirectory)
                   .getNonexistentChildFile(juce::String("cuemix-") + name,
                                            {}, false);
    const bool created = dir.createDirectory().wasOk();
    assert(created);
    (void)created;
    return dir;
}

Project MakeShow(RecordingBackend& backend)
{
    Project project;
    project.set_master_volume(0.8F);
    assert(project.AddSound("bell", "/show/bell.wav", backend, nullptr,
                            nullptr));
    assert(project.AddSound("Rain & \"wind\"", "/show/rain loop.wav",
                            backend, nullptr, nullptr));
    assert(project.AddMixer("Main", nullptr));
    assert(project.AddMixer("FX <2>", nullptr));
    assert(project.AddCue("Main", "Preshow", CueAction::kPlay,
                          "Rain & \"wind\"", nullptr));
    assert(project.AddCue("Main", "Bell", CueAction::kPlay, "bell", nullptr));
    assert(project.AddCue("Main", "Fade out", CueAction::kStop,
                          "Rain & \"wind\"", nullptr));
    assert(project.AddCue("FX <2>", "Placeholder", CueAction::kPlay, "",
                          nullptr));
    assert(project.FindMixer("Main")->SetCueFade(
        2U, FadeTime(2.5, FadeUnit::kSeconds), nullptr));
    assert(project.FindMixer("Main")->SetCueFade(
        0U, FadeTime(10.0, FadeUnit::kPercent), nullptr));
    return project;
}

bool SameContent(const Project& a, const Project& b)
{
    if (a.master_volume() != b.master_volume() ||
        a.sounds().sounds() != b.sounds().sounds() ||
        a.mixers().size() != b.mixers().size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.mixers().size(); ++i) {
        if (a.mixers()[i].name() != b.mixers()[i].name() ||
            a.mixers()[i].cues() != b.mixers()[i].cues()) {
            return false;
        }
    }
    return true;
}

const char* kMinimalProject =
    "<CUEMIX_PROJECT version=\"1\">"
    "<MASTER volume=\"0.5\"/>"
    "<SOUNDS><SOUND name=\"a\" path=\"/a.wav\"/></SOUNDS>"
    "<MIXERS><MIXER name=\"M\">"
    "<CUE name=\"one\" action=\"play\" sound=\"a\"/>"
    "</MIXER></MIXERS>"
    "</CUEMIX_PROJECT>";

void ExpectRejected(const std::string& text, const CueError expected)
{
    Project target;
    target.set_master_volume(0.3F);
    assert(target.AddMixer("keep", nullptr));

    CueError error = CueError::kNone;
    std::string detail;
    const bool loaded =
        cuemix::DeserializeProject(text, target, &error, &detail);
    assert(!loaded);
    assert(error == expected);
    assert(!detail.empty());

    // A failed load leaves the target untouched.
    assert(target.master_volume() == 0.3F);
    assert(target.mixers().size() == 1U);
    assert(target.FindMixer("keep") != nullptr);
    (void)loaded;
}

std::string Replace(std::string text, const std::string& from,
                    const std::string& to)
{
    const auto pos = text.find(from);
    assert(pos != std::string::npos);
    return text.replace(pos, from.size(), to);
}

}  // namespace

int main()
{
    // Round trip keeps content and resets cursors.
    {
        RecordingBackend backend;
        Project project = MakeShow(backend);
        assert(project.ExecuteCue("Main", backend, nullptr));
        assert(project.ExecuteCue("Main", backend, nullptr));
        assert(project.FindMixer("Main")->cursor() == 2U);

        const std::string text = cuemix::SerializeProject(project);
        assert(text.find("CUEMIX_PROJECT") != std::string::npos);
        assert(text.find("<!--") != std::string::npos);
        assert(text.find("fade=\"2.5s\"") != std::string::npos);

        Project loaded;
        CueError error = CueError::kNone;
        assert(cuemix::DeserializeProject(text, loaded, &error, nullptr));
        assert(SameContent(project, loaded));
        for (const auto& mixer : loaded.mixers()) {
            assert(mixer.cursor() == 0U);
        }

        // Serialization is stable.
        assert(cuemix::SerializeProject(loaded) == text);
    }

    // Extreme and many-digit fades survive a save and reload.
    {
        Project project;
        assert(project.AddMixer("M", nullptr));
        const char* fades[] = {"1234567ms", "0.00001s", "0.1234567s"};
        for (const char* fade : fades) {
            assert(project.AddCue("M", fade, CueAction::kPlay, "", nullptr));
        }
        Mixer* const mixer = project.FindMixer("M");
        for (std::size_t i = 0; i < 3U; ++i) {
            assert(mixer->SetCueFade(i, *FadeTime::Parse(fades[i]), nullptr));
        }

        Project loaded;
        CueError error = CueError::kNone;
        assert(cuemix::DeserializeProject(cuemix::SerializeProject(project),
                                          loaded, &error, nullptr));
        assert(loaded.FindMixer("M")->cues() == mixer->cues());
        assert(loaded.FindMixer("M")->cue(0U)->fade().ToString() ==
               "1234567ms");
    }

    // Minimal hand-written file; fade defaults to zero.
    {
        Project loaded;
        assert(cuemix::DeserializeProject(kMinimalProject, loaded, nullptr,
                                          nullptr));
        assert(loaded.master_volume() == 0.5F);
        assert(loaded.sounds().size() == 1U);
        const auto* mixer = loaded.FindMixer("M");
        assert(mixer != nullptr);
        assert(mixer->cue_count() == 1U);
        assert(mixer->cue(0U)->fade().is_zero());
        assert(mixer->cue(0U)->action() == CueAction::kPlay);
    }

    // Malformed XML.
    ExpectRejected("", CueError::kParseError);
    ExpectRejected("<CUEMIX_PROJECT version=\"1\"><MASTER volume=\"1\">",
                   CueError::kParseError);
    ExpectRejected("this is not xml", CueError::kParseError);

    // Well-formed XML that is not a valid project.
    const std::string minimal = kMinimalProject;
    ExpectRejected("<SHOW/>", CueError::kSchemaError);
    ExpectRejected(Replace(minimal, "version=\"1\"", "version=\"2\""),
                   CueError::kSchemaError);
    ExpectRejected(Replace(minimal, "version=\"1\"", "version=\"1abc\""),
                   CueError::kSchemaError);
    ExpectRejected(Replace(minimal, "version=\"1\"", "version=\"1.9\""),
                   CueError::kSchemaError);
    ExpectRejected(Replace(minimal, "version=\"1\"", ""),
                   CueError::kSchemaError);
    ExpectRejected(Replace(minimal, "<MASTER volume=\"0.5\"/>", ""),
                   CueError::kSchemaError);
    ExpectRejected(Replace(minimal, "volume=\"0.5\"", "volume=\"1.5\""),
                   CueError::kSchemaError);
    ExpectRejected(Replace(minimal, "volume=\"0.5\"", "volume=\"loud\""),
                   CueError::kSchemaError);
    ExpectRejected(Replace(minimal, "action=\"play\"", "action=\"pause\""),
                   CueError::kSchemaError);
    ExpectRejected(Replace(minimal, "sound=\"a\"",
                           "sound=\"a\" fade=\"soon\""),
                   CueError::kSchemaError);
    ExpectRejected(Replace(minimal, "sound=\"a\"", "sound=\"b\""),
                   CueError::kSchemaError);
    ExpectRejected(Replace(minimal, "<SOUNDS>",
                           "<SOUNDS><SOUND name=\"a\" path=\"/x.wav\"/>"),
                   CueError::kSchemaError);
    ExpectRejected(Replace(minimal, "</MIXERS>",
                           "<MIXER name=\"M\"/></MIXERS>"),
                   CueError::kSchemaError);
    ExpectRejected(Replace(minimal, "<MIXER name=\"M\">",
                           "<MIXER name=\"\">"),
                   CueError::kSchemaError);
    ExpectRejected(Replace(minimal, " path=\"/a.wav\"", ""),
                   CueError::kSchemaError);

    // Files: save, load, relative sound paths, missing files.
    {
        const auto dir = MakeTempDirectory("files");
        RecordingBackend backend;
        const Project project = MakeShow(backend);

        const auto path = dir.getChildFile("nested/show.cuemix");
        CueError error = CueError::kNone;
        assert(cuemix::SaveProjectToFile(
            project, cuemix::ToStdString(path.getFullPathName()), &error,
            nullptr));
        assert(path.existsAsFile());

        Project loaded;
        assert(cuemix::LoadProjectFromFile(
            cuemix::ToStdString(path.getFullPathName()), loaded, &error,
            nullptr));
        assert(SameContent(project, loaded));

        const auto relative = dir.getChildFile("relative.cuemix");
        assert(relative.replaceWithText(
            Replace(minimal, "path=\"/a.wav\"", "path=\"audio/a.wav\"")));
        assert(cuemix::LoadProjectFromFile(
            cuemix::ToStdString(relative.getFullPathName()), loaded, &error,
            nullptr));
        assert(loaded.sounds().Find("a")->path ==
               cuemix::ToStdString(
                   dir.getChildFile("audio/a.wav").getFullPathName()));

        error = CueError::kNone;
        assert(!cuemix::LoadProjectFromFile(
            cuemix::ToStdString(dir.getChildFile("none.cuemix")
                                    .getFullPathName()),
            loaded, &error, nullptr));
        assert(error == CueError::kNotFound);

        assert(cuemix::WithProjectExtension("/shows/opening") ==
               "/shows/opening.cuemix");
        assert(cuemix::WithProjectExtension("/shows/opening.txt") ==
               "/shows/opening.cuemix");
        assert(cuemix::WithProjectExtension("/shows/opening.CUEMIX") ==
               "/shows/opening.CUEMIX");

        dir.deleteRecursively();
    }

    // Document save state.
    {
        const auto dir = MakeTempDirectory("document");
        RecordingBackend backend;
        ProjectDocument document;
        assert(!document.HasUnsavedChanges());
        assert(!document.has_path());
        assert(document.DisplayName() == "Untitled");

        CueError error = CueError::kNone;
        assert(!document.Save(&error, nullptr));
        assert(error == CueError::kNotFound);

        assert(document.history().Apply(
            "Add mixer", [](Project& project) {
                return project.AddMixer("Main", nullptr);
            }));
        assert(document.HasUnsavedChanges());

        const std::string target =
            cuemix::ToStdString(dir.getChildFile("first").getFullPathName());
        assert(document.SaveAs(target, &error, nullptr));
        assert(document.path() == target + ".cuemix");
        assert(document.DisplayName() == "first.cuemix");
        assert(!document.HasUnsavedChanges());

        // Running the show is not an edit.
        assert(document.history().Apply("Add cue", [](Project& project) {
            return project.AddCue("Main", "Go", CueAction::kPlay, "",
                                  nullptr);
        }));
        assert(document.Save(&error, nullptr));
        assert(document.project().ExecuteCue("Main", backend, nullptr));
        assert(!document.HasUnsavedChanges());

        assert(document.history().Undo());
        assert(document.HasUnsavedChanges());
        assert(document.history().Redo());
        assert(!document.HasUnsavedChanges());

        // Opening replaces the project and clears the history.
        ProjectDocument other;
        assert(other.Open(document.path(), &error, nullptr));
        assert(other.project().FindMixer("Main")->cue_count() == 1U);
        assert(!other.HasUnsavedChanges());
        assert(!other.history().CanUndo());

        error = CueError::kNone;
        assert(!other.Open(cuemix::ToStdString(
                               dir.getChildFile("missing.cuemix")
                                   .getFullPathName()),
                           &error, nullptr));
        assert(error == CueError::kNotFound);
        assert(other.project().FindMixer("Main") != nullptr);

        other.New();
        assert(other.project().empty());
        assert(!other.has_path());
        assert(!other.HasUnsavedChanges());

        dir.deleteRecursively();
    }

    // Bundles.
    {
        const auto dir = MakeTempDirectory("bundle");
        const auto first = dir.getChildFile("a/hit.wav");
        const auto second = dir.getChildFile("b/hit.wav");
        assert(first.getParentDirectory().createDirectory().wasOk());
        assert(second.getParentDirectory().createDirectory().wasOk());
        assert(first.replaceWithText("first sample"));
        assert(second.replaceWithText("second sample"));

        RecordingBackend backend;
        Project project;
        assert(project.AddSound(
            "hit A", cuemix::ToStdString(first.getFullPathName()), backend,
            nullptr, nullptr));
        assert(project.AddSound(
            "hit B", cuemix::ToStdString(second.getFullPathName()), backend,
            nullptr, nullptr));
        assert(project.AddMixer("M", nullptr));
        assert(project.AddCue("M", "1", CueAction::kPlay, "hit A", nullptr));
        assert(project.AddCue("M", "2", CueAction::kPlay, "hit B", nullptr));

        assert(cuemix::WithBundleExtension("/x/show") == "/x/show.cuemixz");
        const std::string bundle =
            cuemix::ToStdString(dir.getChildFile("Show.cuemixz")
                                    .getFullPathName());

#if defined(CUEMIX_HAVE_LIBZIP)
        CueError error = CueError::kNone;
        assert(cuemix::ExportProjectBundle(project, bundle, &error, nullptr));

        const auto extractRoot = dir.getChildFile("extracted");
        Project imported;
        std::string extracted;
        assert(cuemix::ImportProjectBundle(
            bundle, cuemix::ToStdString(extractRoot.getFullPathName()),
            imported, &extracted, &error, nullptr));
        assert(extracted ==
               cuemix::ToStdString(
                   extractRoot.getChildFile("Show.cuemix").getFullPathName()));

        const auto* soundA = imported.sounds().Find("hit A");
        const auto* soundB = imported.sounds().Find("hit B");
        assert(soundA != nullptr && soundB != nullptr);
        assert(soundA->path != soundB->path);
        assert(cuemix::ToJuceFile(soundA->path).loadFileAsString() ==
               "first sample");
        assert(cuemix::ToJuceFile(soundB->path).loadFileAsString() ==
               "second sample");
        assert(imported.FindMixer("M")->cues() ==
               project.FindMixer("M")->cues());

        // Importing again over identical files succeeds.
        assert(cuemix::ImportProjectBundle(
            bundle, cuemix::ToStdString(extractRoot.getFullPathName()),
            imported, nullptr, &error, nullptr));

        // Documents open bundles next to the archive.
        ProjectDocument document;
        assert(document.Open(bundle, &error, nullptr));
        assert(document.path() ==
               cuemix::ToStdString(
                   dir.getChildFile("Show.cuemix").getFullPathName()));
        assert(document.project().sounds().size() == 2U);

        // Not a ZIP archive.
        const auto fake = dir.getChildFile("fake.cuemixz");
        assert(fake.replaceWithText("<CUEMIX_PROJECT/>"));
        error = CueError::kNone;
        assert(!cuemix::ImportProjectBundle(
            cuemix::ToStdString(fake.getFullPathName()), {}, imported,
            nullptr, &error, nullptr));
        assert(error == CueError::kFileUnreadable);

        // Missing sound file.
        assert(project.RelocateSound(
            "hit B",
            cuemix::ToStdString(dir.getChildFile("gone.wav")
                                    .getFullPathName()),
            nullptr));
        error = CueError::kNone;
        assert(!cuemix::ExportProjectBundle(project, bundle, &error,
                                            nullptr));
        assert(error == CueError::kFileUnreadable);
#else
        CueError error = CueError::kNone;
        std::string detail;
        assert(!cuemix::ExportProjectBundle(project, bundle, &error,
                                            &detail));
        assert(error == CueError::kWriteFailed);
        assert(!detail.empty());
#endif

        dir.deleteRecursively();
    }

    std::cout << "cuemix-serialization-tests: OK" << std::endl;
    return 0;
}
