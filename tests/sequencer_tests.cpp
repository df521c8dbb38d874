#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "RecordingBackend.h"
#include "core/Cue.h"
#include "core/CueError.h"
#include "core/FadeTime.h"
#include "core/Mixer.h"
#include "core/Project.h"
#include "core/SoundRegistry.h"

// Cue sequencing: cursor state machine, execution against the playback
// backend and cue list editing while a show is running.

using cuemix::Cue;
using cuemix::CueAction;
using cuemix::CueDisplayState;
using cuemix::CueError;
using cuemix::FadeTime;
using cuemix::FadeUnit;
using cuemix::Mixer;
using cuemix::Project;
using cuemix::SoundRegistry;

namespace {

std::vector<std::string> CueNames(const Mixer& mixer)
{
    std::vector<std::string> names;
    for (const auto& cue : mixer.cues()) {
        names.push_back(cue.name());
    }
    return names;
}

}  // namespace

int main()
{
    // An empty mixer has a single position that is both start and end.
    {
        SoundRegistry sounds;
        RecordingBackend backend;
        Mixer mixer("Empty");

        assert(mixer.cursor() == 0U);
        assert(mixer.at_start());
        assert(mixer.finished());
        assert(mixer.active_cue() == nullptr);

        CueError error = CueError::kNone;
        assert(!mixer.Execute(sounds, backend, &error));
        assert(error == CueError::kNothingToExecute);

        error = CueError::kNone;
        assert(!mixer.Back(&error));
        assert(error == CueError::kAlreadyAtStart);

        error = CueError::kNone;
        assert(!mixer.JumpTo(0U, &error));
        assert(error == CueError::kOutOfRange);

        mixer.Reset();
        assert(mixer.cursor() == 0U);
        assert(backend.calls.empty());
    }

    // Play then stop a bell: each Execute issues one request and
    // advances; the third one has nothing left to run.
    {
        Project project;
        RecordingBackend backend;
        CueError error = CueError::kNone;

        assert(project.AddSound("bell", "/show/bell.wav", backend, &error,
                                nullptr));
        assert(project.AddMixer("M1", &error));
        assert(project.AddCue("M1", "Ring", CueAction::kPlay, "bell", &error));
        assert(project.AddCue("M1", "Silence", CueAction::kStop, "bell",
                              &error));

        const Mixer* mixer = project.FindMixer("M1");
        assert(mixer != nullptr);
        assert(mixer->cursor() == 0U);
        assert(mixer->active_cue()->name() == "Ring");

        assert(project.ExecuteCue("M1", backend, &error));
        assert(mixer->cursor() == 1U);
        assert(backend.calls.size() == 1U);
        assert(backend.calls[0].kind == "play");
        assert(backend.calls[0].sound == "bell");

        assert(project.ExecuteCue("M1", backend, &error));
        assert(mixer->cursor() == 2U);
        assert(mixer->finished());
        assert(backend.calls.size() == 2U);
        assert(backend.calls[1].kind == "stop");
        assert(backend.calls[1].sound == "bell");

        error = CueError::kNone;
        assert(!project.ExecuteCue("M1", backend, &error));
        assert(error == CueError::kNothingToExecute);
        assert(mixer->cursor() == 2U);
        assert(backend.calls.size() == 2U);

        error = CueError::kNone;
        assert(!project.ExecuteCue("Nope", backend, &error));
        assert(error == CueError::kNotFound);
    }

    // N cues give N+1 positions; display states follow the cursor.
    {
        SoundRegistry sounds;
        RecordingBackend backend;
        Mixer mixer("Walk");
        for (int i = 0; i < 4; ++i) {
            mixer.AddCue("Cue " + std::to_string(i + 1), CueAction::kPlay,
                         std::string());
        }

        for (std::size_t step = 0; step < 4U; ++step) {
            assert(mixer.cursor() == step);
            for (std::size_t i = 0; i < mixer.cue_count(); ++i) {
                const CueDisplayState expected =
                    i < step ? CueDisplayState::kExecuted
                             : (i == step ? CueDisplayState::kActive
                                          : CueDisplayState::kPending);
                assert(mixer.display_state(i) == expected);
            }
            assert(mixer.Execute(sounds, backend, nullptr));
        }
        assert(mixer.cursor() == 4U);
        assert(mixer.finished());
        for (std::size_t i = 0; i < 4U; ++i) {
            assert(mixer.display_state(i) == CueDisplayState::kExecuted);
        }

        CueError error = CueError::kNone;
        assert(!mixer.Execute(sounds, backend, &error));
        assert(error == CueError::kNothingToExecute);

        // Unassigned cues never reach the backend.
        assert(backend.calls.empty());
    }

    // Back moves the pointer only; Reset is idempotent.
    {
        Project project;
        RecordingBackend backend;
        assert(project.AddSound("hit", "hit.wav", backend, nullptr, nullptr));
        assert(project.AddMixer("M", nullptr));
        assert(project.AddCue("M", "A", CueAction::kPlay, "hit", nullptr));
        assert(project.AddCue("M", "B", CueAction::kPlay, "hit", nullptr));

        Mixer* mixer = project.FindMixer("M");
        assert(project.ExecuteCue("M", backend, nullptr));
        assert(project.ExecuteCue("M", backend, nullptr));
        assert(mixer->finished());
        const std::size_t requests = backend.calls.size();

        assert(mixer->Back(nullptr));
        assert(mixer->cursor() == 1U);
        assert(mixer->active_cue()->name() == "B");
        assert(backend.calls.size() == requests);

        assert(mixer->Back(nullptr));
        assert(mixer->at_start());
        CueError error = CueError::kNone;
        assert(!mixer->Back(&error));
        assert(error == CueError::kAlreadyAtStart);
        assert(mixer->cursor() == 0U);

        assert(project.ExecuteCue("M", backend, nullptr));
        mixer->Reset();
        assert(mixer->cursor() == 0U);
        mixer->Reset();
        assert(mixer->cursor() == 0U);

        assert(project.ExecuteCue("M", backend, nullptr));
        project.ResetAllCursors();
        assert(mixer->at_start());
    }

    // JumpTo selects any existing cue without running it.
    {
        Mixer mixer("Jump");
        mixer.AddCue("A", CueAction::kPlay, "");
        mixer.AddCue("B", CueAction::kPlay, "");
        mixer.AddCue("C", CueAction::kPlay, "");

        assert(mixer.JumpTo(2U, nullptr));
        assert(mixer.cursor() == 2U);
        assert(mixer.active_cue()->name() == "C");
        assert(mixer.display_state(0U) == CueDisplayState::kExecuted);
        assert(mixer.display_state(2U) == CueDisplayState::kActive);

        assert(mixer.JumpTo(0U, nullptr));
        assert(mixer.at_start());

        CueError error = CueError::kNone;
        assert(!mixer.JumpTo(3U, &error));
        assert(error == CueError::kOutOfRange);
        assert(mixer.cursor() == 0U);
    }

    // Appending then deleting the appended cue restores the mixer.
    {
        SoundRegistry sounds;
        RecordingBackend backend;
        Mixer mixer("Edit");
        mixer.AddCue("A", CueAction::kPlay, "");
        mixer.AddCue("B", CueAction::kPlay, "");
        mixer.AddCue("C", CueAction::kPlay, "");
        assert(mixer.Execute(sounds, backend, nullptr));

        const auto before = CueNames(mixer);
        const std::size_t cursor = mixer.cursor();

        mixer.AddCue("D", CueAction::kStop, "");
        assert(mixer.cue_count() == 4U);
        assert(mixer.cursor() == cursor);
        assert(mixer.DeleteCue(3U, nullptr));
        assert(CueNames(mixer) == before);
        assert(mixer.cursor() == cursor);

        // Deleting the active cue keeps the cursor index, so its
        // successor becomes active.
        assert(mixer.DeleteCue(1U, nullptr));
        assert(mixer.cursor() == 1U);
        assert(mixer.active_cue()->name() == "C");

        // Deleting an executed cue keeps the same cues executed.
        mixer.AddCue("E", CueAction::kPlay, "");
        assert(mixer.JumpTo(2U, nullptr));
        assert(mixer.DeleteCue(0U, nullptr));
        assert(mixer.cursor() == 1U);
        assert(mixer.active_cue()->name() == "E");

        CueError error = CueError::kNone;
        assert(!mixer.DeleteCue(5U, &error));
        assert(error == CueError::kOutOfRange);
    }

    // Deleting the last cue while it is active leaves the mixer
    // finished; appending to a finished mixer makes the new cue active.
    {
        SoundRegistry sounds;
        RecordingBackend backend;
        Mixer mixer("Tail");
        mixer.AddCue("A", CueAction::kPlay, "");
        mixer.AddCue("B", CueAction::kPlay, "");
        assert(mixer.Execute(sounds, backend, nullptr));
        assert(mixer.active_cue()->name() == "B");

        assert(mixer.DeleteCue(1U, nullptr));
        assert(mixer.cursor() == 1U);
        assert(mixer.finished());

        mixer.AddCue("C", CueAction::kPlay, "");
        assert(!mixer.finished());
        assert(mixer.active_cue()->name() == "C");

        // Removing every cue brings the cursor back to 0.
        assert(mixer.DeleteCue(1U, nullptr));
        assert(mixer.DeleteCue(0U, nullptr));
        assert(mixer.cue_count() == 0U);
        assert(mixer.cursor() == 0U);
    }

    // MoveCue reorders without moving the cursor index.
    {
        Mixer mixer("Move");
        mixer.AddCue("A", CueAction::kPlay, "");
        mixer.AddCue("B", CueAction::kPlay, "");
        mixer.AddCue("C", CueAction::kPlay, "");
        assert(mixer.JumpTo(1U, nullptr));

        assert(mixer.MoveCue(0U, 2U, nullptr));
        assert((CueNames(mixer) == std::vector<std::string>{"B", "C", "A"}));
        assert(mixer.cursor() == 1U);
        assert(mixer.active_cue()->name() == "C");

        assert(mixer.MoveCue(2U, 0U, nullptr));
        assert((CueNames(mixer) == std::vector<std::string>{"A", "B", "C"}));

        assert(mixer.MoveCue(1U, 1U, nullptr));
        CueError error = CueError::kNone;
        assert(!mixer.MoveCue(0U, 3U, &error));
        assert(error == CueError::kOutOfRange);
    }

    // A cue whose sound disappeared fails without advancing; an
    // unassigned cue advances silently.
    {
        SoundRegistry sounds;
        RecordingBackend backend;
        Mixer mixer("Lost");
        mixer.AddCue("Ghost", CueAction::kPlay, "missing");
        mixer.AddCue("Blank", CueAction::kPlay, "");

        CueError error = CueError::kNone;
        assert(!mixer.Execute(sounds, backend, &error));
        assert(error == CueError::kNotFound);
        assert(mixer.cursor() == 0U);
        assert(backend.calls.empty());

        assert(mixer.JumpTo(1U, nullptr));
        assert(mixer.Execute(sounds, backend, nullptr));
        assert(mixer.finished());
        assert(backend.calls.empty());
    }

    // Fade times reach the backend in milliseconds; percent fades use
    // the decoded length of the sound.
    {
        Project project;
        RecordingBackend backend;
        backend.lengths_ms["pad.wav"] = 8000.0;
        assert(project.AddSound("pad", "pad.wav", backend, nullptr, nullptr));
        assert(project.AddMixer("M", nullptr));
        assert(project.AddCue("M", "In", CueAction::kPlay, "pad", nullptr));
        assert(project.AddCue("M", "Out", CueAction::kStop, "pad", nullptr));
        assert(project.AddCue("M", "Again", CueAction::kPlay, "pad",
                              nullptr));

        Mixer* mixer = project.FindMixer("M");
        assert(mixer->SetCueFade(0U, FadeTime(1.5, FadeUnit::kSeconds),
                                 nullptr));
        assert(mixer->SetCueFade(1U, FadeTime(25.0, FadeUnit::kPercent),
                                 nullptr));

        assert(project.ExecuteCue("M", backend, nullptr));
        assert(project.ExecuteCue("M", backend, nullptr));
        assert(project.ExecuteCue("M", backend, nullptr));

        assert(backend.calls.size() == 3U);
        assert(backend.calls[0].kind == "play");
        assert(backend.calls[0].fade_ms == 1500.0);
        assert(backend.calls[1].kind == "stop");
        assert(backend.calls[1].fade_ms == 2000.0);
        assert(backend.calls[2].fade_ms == 0.0);
    }

    // Cue editing through the mixer.
    {
        Mixer mixer("Fields");
        mixer.AddCue("A", CueAction::kPlay, "one");
        assert(mixer.SetCueName(0U, "Opening", nullptr));
        assert(mixer.SetCueAction(0U, CueAction::kStop, nullptr));
        assert(mixer.SetCueSound(0U, "two", nullptr));

        const Cue& cue = *mixer.cue(0U);
        assert(cue.name() == "Opening");
        assert(cue.action() == CueAction::kStop);
        assert(cue.sound_name() == "two");
        assert(mixer.CountSoundReferences("two") == 1U);
        assert(mixer.CountSoundReferences("one") == 0U);

        mixer.RenameSoundReferences("two", "three");
        assert(mixer.cue(0U)->sound_name() == "three");

        CueError error = CueError::kNone;
        assert(!mixer.SetCueName(4U, "x", &error));
        assert(error == CueError::kOutOfRange);
        assert(mixer.cue(4U) == nullptr);

        // Cursor restoration is clamped to the cue count.
        mixer.RestoreCursor(7U);
        assert(mixer.cursor() == 1U);
    }

    std::cout << "cuemix-sequencer-tests: OK" << std::endl;
    return 0;
}
