#include "CueShell.h"

#include <exception>
#include <iomanip>
#include <utility>

#include <juce_core/juce_core.h>

#include "core/Cue.h"
#include "core/FadeTime.h"
#include "core/Mixer.h"
#include "core/ProjectBundle.h"
#include "core/SoundRegistry.h"
#include "core/StringConversions.h"

using cuemix::CueError;

namespace {

char stateMarker(const cuemix::CueDisplayState state)
{
    switch (state) {
        case cuemix::CueDisplayState::kExecuted:
            return 'x';
        case cuemix::CueDisplayState::kActive:
            return '>';
        case cuemix::CueDisplayState::kPending:
            break;
    }
    return ' ';
}

std::string quoted(const std::string& text)
{
    return "'" + text + "'";
}

}  // namespace

CueShell::CueShell(cuemix::ProjectDocument& document,
                   cuemix::PlaybackBackend& backend, std::ostream& out)
    : document_(document), backend_(backend), out_(out)
{
}

const std::vector<CueShell::Command>& CueShell::commands()
{
    static const std::vector<Command> kCommands = {
        {"help", "help", "List commands", 0, &CueShell::cmdHelp},
        {"status", "status", "Project and mixer positions", 0,
         &CueShell::cmdStatus},
        {"sounds", "sounds", "List registered sounds", 0,
         &CueShell::cmdSounds},
        {"mixers", "mixers", "List mixers", 0, &CueShell::cmdMixers},
        {"show", "show <mixer>", "Print a mixer's cue list", 1,
         &CueShell::cmdShow},
        {"go", "go <mixer>", "Execute the active cue and advance", 1,
         &CueShell::cmdGo},
        {"back", "back <mixer>", "Step the cursor back (no audio)", 1,
         &CueShell::cmdBack},
        {"reset", "reset <mixer>|all", "Return to the first cue", 1,
         &CueShell::cmdReset},
        {"jump", "jump <mixer> <n>", "Make cue n active without running it",
         2, &CueShell::cmdJump},
        {"volume", "volume [0..1]", "Show or set the master volume", 0,
         &CueShell::cmdVolume},
        {"stop-all", "stop-all [fade]", "Stop every playing sound", 0,
         &CueShell::cmdStopAll},
        {"add-sound", "add-sound <path> [name]", "Register a sound file", 1,
         &CueShell::cmdAddSound},
        {"rename-sound", "rename-sound <old> <new>",
         "Rename a sound and the cues using it", 2,
         &CueShell::cmdRenameSound},
        {"remove-sound", "remove-sound <name>",
         "Remove a sound no cue uses", 1, &CueShell::cmdRemoveSound},
        {"add-mixer", "add-mixer [name]", "Create a mixer", 0,
         &CueShell::cmdAddMixer},
        {"rename-mixer", "rename-mixer <old> <new>", "Rename a mixer", 2,
         &CueShell::cmdRenameMixer},
        {"remove-mixer", "remove-mixer <name>", "Delete a mixer", 1,
         &CueShell::cmdRemoveMixer},
        {"add-cue", "add-cue <mixer> <play|stop> [sound] [name]",
         "Append a cue", 2, &CueShell::cmdAddCue},
        {"delete-cue", "delete-cue <mixer> <n>", "Delete cue n", 2,
         &CueShell::cmdDeleteCue},
        {"move-cue", "move-cue <mixer> <from> <to>", "Reorder a cue", 3,
         &CueShell::cmdMoveCue},
        {"set-fade", "set-fade <mixer> <n> <fade>",
         "Set a fade: 250ms, 1.5s, 2m or 10%", 3, &CueShell::cmdSetFade},
        {"set-sound", "set-sound <mixer> <n> [sound]",
         "Assign (or clear) a cue's sound", 2, &CueShell::cmdSetSound},
        {"set-action", "set-action <mixer> <n> <play|stop>",
         "Change a cue's action", 3, &CueShell::cmdSetAction},
        {"rename-cue", "rename-cue <mixer> <n> <name>", "Rename a cue", 3,
         &CueShell::cmdRenameCue},
        {"undo", "undo", "Undo the last edit", 0, &CueShell::cmdUndo},
        {"redo", "redo", "Redo the last undone edit", 0, &CueShell::cmdRedo},
        {"new", "new", "Start an empty project", 0, &CueShell::cmdNew},
        {"new!", "new!", "Start an empty project, discarding changes", 0,
         &CueShell::cmdForceNew},
        {"open", "open <path>", "Open a .cuemix project or .cuemixz bundle",
         1, &CueShell::cmdOpen},
        {"open!", "open! <path>", "Open, discarding changes", 1,
         &CueShell::cmdForceOpen},
        {"save", "save [path]", "Save the project", 0, &CueShell::cmdSave},
        {"export", "export <bundle>", "Write a .cuemixz bundle", 1,
         &CueShell::cmdExport},
        {"quit", "quit", "Exit (refused with unsaved changes)", 0,
         &CueShell::cmdQuit},
        {"quit!", "quit!", "Exit, discarding changes", 0,
         &CueShell::cmdForceQuit},
    };
    return kCommands;
}

CueShell::Args CueShell::tokenize(const std::string& line)
{
    juce::StringArray tokens;
    tokens.addTokens(cuemix::ToJuceString(line), " \t", "\"");
    tokens.trim();
    tokens.removeEmptyStrings();

    Args args;
    args.reserve(static_cast<std::size_t>(tokens.size()));
    for (const auto& token : tokens) {
        args.push_back(cuemix::ToStdString(token.unquoted()));
    }
    return args;
}

bool CueShell::execute(const std::string& line)
{
    Args args = tokenize(line);
    if (args.empty() || args.front().rfind('#', 0) == 0) {
        return !quit_;
    }

    const std::string name = args.front();
    args.erase(args.begin());

    for (const auto& command : commands()) {
        if (name != command.name) {
            continue;
        }
        if (args.size() < command.minArgs) {
            out_ << "usage: " << command.usage << "\n";
            return !quit_;
        }
        (this->*command.handler)(args);
        return !quit_;
    }

    out_ << "Unknown command '" << name << "'. Type 'help'.\n";
    return !quit_;
}

void CueShell::run(std::istream& in)
{
    std::string line;
    while (!quit_) {
        out_ << "cuemix> " << std::flush;
        if (!std::getline(in, line)) {
            out_ << "\n";
            break;
        }
        execute(line);
    }
}

void CueShell::syncBackend()
{
    const auto& project = document_.project();
    backend_.SetMasterVolume(project.master_volume());
    releaseUnusedSounds();
    for (const auto& sound : project.sounds().sounds()) {
        std::string detail;
        if (!backend_.Preload(sound.path, &detail)) {
            out_ << "warning: sound " << quoted(sound.name)
                 << " cannot be played: " << detail << "\n";
        }
    }
}

void CueShell::releaseUnusedSounds()
{
    std::vector<std::string> paths;
    for (const auto& sound : document_.project().sounds().sounds()) {
        paths.push_back(sound.path);
    }
    backend_.ReleaseUnused(paths);
}

bool CueShell::applyEdit(const std::string& description, const Edit& edit)
{
    CueError error = CueError::kNone;
    std::string detail;
    const bool applied = document_.history().Apply(
        description, [&](cuemix::Project& project) {
            return edit(project, &error, &detail);
        });
    if (!applied) {
        reportError(error, detail);
        return false;
    }
    return true;
}

void CueShell::reportError(const CueError error, const std::string& detail)
{
    out_ << "error: " << cuemix::CueErrorName(error) << ": "
         << cuemix::DescribeCueError(error);
    if (!detail.empty()) {
        out_ << " (" << detail << ")";
    }
    out_ << "\n";
}

cuemix::Mixer* CueShell::findMixer(const std::string& name)
{
    cuemix::Mixer* const mixer = document_.project().FindMixer(name);
    if (mixer == nullptr) {
        reportError(CueError::kNotFound, "no mixer " + quoted(name));
    }
    return mixer;
}

bool CueShell::parseCueNumber(const std::string& text,
                              const cuemix::Mixer& mixer,
                              std::size_t& index)
{
    std::size_t number = 0;
    try {
        std::size_t consumed = 0;
        number = std::stoul(text, &consumed);
        if (consumed != text.size()) {
            number = 0;
        }
    } catch (const std::exception&) {
        number = 0;
    }

    if (number == 0 || number > mixer.cue_count()) {
        reportError(CueError::kOutOfRange,
                    "cue " + text + " of " + quoted(mixer.name()) +
                        " which has " + std::to_string(mixer.cue_count()) +
                        " cues");
        return false;
    }
    index = number - 1;
    return true;
}

bool CueShell::refuseWithUnsavedChanges(const char* command)
{
    if (!document_.HasUnsavedChanges()) {
        return false;
    }
    out_ << "The project has unsaved changes. Save first, or use '"
         << command << "!' to discard them.\n";
    return true;
}

void CueShell::printMixerPosition(const cuemix::Mixer& mixer)
{
    out_ << mixer.name() << ": ";
    if (mixer.cue_count() == 0) {
        out_ << "empty\n";
        return;
    }
    if (mixer.finished()) {
        out_ << "finished (" << mixer.cue_count() << "/"
             << mixer.cue_count() << " executed)\n";
        return;
    }
    out_ << "next " << (mixer.cursor() + 1) << "/" << mixer.cue_count()
         << " " << quoted(mixer.active_cue()->name()) << "\n";
}

void CueShell::printMixer(const cuemix::Mixer& mixer)
{
    out_ << "Mixer " << quoted(mixer.name()) << "\n";
    if (mixer.cue_count() == 0) {
        out_ << "  (no cues)\n";
        return;
    }
    for (std::size_t i = 0; i < mixer.cue_count(); ++i) {
        const cuemix::Cue& cue = *mixer.cue(i);
        out_ << "  " << stateMarker(mixer.display_state(i)) << " "
             << std::setw(3) << (i + 1) << ". " << cue.name() << "  "
             << cuemix::CueActionName(cue.action()) << " "
             << (cue.has_sound() ? cue.sound_name() : "(no sound)")
             << "  fade " << cue.fade().ToString() << "\n";
    }
    if (mixer.finished()) {
        out_ << "  (finished)\n";
    }
}

void CueShell::printSummary()
{
    cmdStatus({});
    cmdSounds({});
    for (const auto& mixer : document_.project().mixers()) {
        printMixer(mixer);
    }
}

// Session -----------------------------------------------------------------

void CueShell::cmdHelp(const Args&)
{
    for (const auto& command : commands()) {
        out_ << "  " << std::left << std::setw(44) << command.usage
             << command.help << "\n";
    }
    out_ << std::right;
}

void CueShell::cmdStatus(const Args&)
{
    const auto& project = document_.project();
    out_ << "Project: " << document_.DisplayName()
         << (document_.HasUnsavedChanges() ? " (modified)" : "") << "\n";
    out_ << "Master volume: " << project.master_volume() << "\n";
    if (project.mixers().empty()) {
        out_ << "No mixers.\n";
    }
    for (const auto& mixer : project.mixers()) {
        out_ << "  ";
        printMixerPosition(mixer);
    }
}

void CueShell::cmdSounds(const Args&)
{
    const auto& project = document_.project();
    if (project.sounds().empty()) {
        out_ << "No sounds.\n";
        return;
    }
    out_ << "Sounds:\n";
    for (const auto& sound : project.sounds().sounds()) {
        out_ << "  " << sound.name << "  " << sound.path;
        const std::size_t uses = project.CountSoundReferences(sound.name);
        if (uses > 0) {
            out_ << "  (" << uses << (uses == 1 ? " cue" : " cues") << ")";
        }
        out_ << "\n";
    }
}

void CueShell::cmdMixers(const Args&)
{
    const auto& mixers = document_.project().mixers();
    if (mixers.empty()) {
        out_ << "No mixers.\n";
        return;
    }
    for (const auto& mixer : mixers) {
        out_ << "  " << mixer.name() << " (" << mixer.cue_count()
             << (mixer.cue_count() == 1 ? " cue" : " cues") << ")\n";
    }
}

void CueShell::cmdShow(const Args& args)
{
    if (const cuemix::Mixer* mixer = findMixer(args[0])) {
        printMixer(*mixer);
    }
}

void CueShell::cmdQuit(const Args&)
{
    if (refuseWithUnsavedChanges("quit")) {
        return;
    }
    quit_ = true;
}

void CueShell::cmdForceQuit(const Args&)
{
    quit_ = true;
}

// Show control ------------------------------------------------------------

void CueShell::cmdGo(const Args& args)
{
    cuemix::Mixer* const mixer = findMixer(args[0]);
    if (mixer == nullptr) {
        return;
    }
    const cuemix::Cue* const cue = mixer->active_cue();
    const std::string cueName = cue != nullptr ? cue->name() : std::string();

    CueError error = CueError::kNone;
    if (!document_.project().ExecuteCue(mixer->name(), backend_, &error)) {
        reportError(error, cue != nullptr && cue->has_sound()
                               ? "sound " + quoted(cue->sound_name())
                               : std::string());
        return;
    }
    out_ << "GO " << quoted(cueName) << "  ";
    printMixerPosition(*mixer);
}

void CueShell::cmdBack(const Args& args)
{
    cuemix::Mixer* const mixer = findMixer(args[0]);
    if (mixer == nullptr) {
        return;
    }
    CueError error = CueError::kNone;
    if (!mixer->Back(&error)) {
        reportError(error);
        return;
    }
    printMixerPosition(*mixer);
}

void CueShell::cmdReset(const Args& args)
{
    if (args[0] == "all") {
        document_.project().ResetAllCursors();
        out_ << "All mixers reset.\n";
        return;
    }
    cuemix::Mixer* const mixer = findMixer(args[0]);
    if (mixer == nullptr) {
        return;
    }
    mixer->Reset();
    printMixerPosition(*mixer);
}

void CueShell::cmdJump(const Args& args)
{
    cuemix::Mixer* const mixer = findMixer(args[0]);
    std::size_t index = 0;
    if (mixer == nullptr || !parseCueNumber(args[1], *mixer, index)) {
        return;
    }
    CueError error = CueError::kNone;
    if (!mixer->JumpTo(index, &error)) {
        reportError(error);
        return;
    }
    printMixerPosition(*mixer);
}

void CueShell::cmdVolume(const Args& args)
{
    if (args.empty()) {
        out_ << "Master volume: " << document_.project().master_volume()
             << "\n";
        return;
    }

    double volume = -1.0;
    try {
        std::size_t consumed = 0;
        volume = std::stod(args[0], &consumed);
        if (consumed != args[0].size()) {
            volume = -1.0;
        }
    } catch (const std::exception&) {
        volume = -1.0;
    }
    if (!(volume >= 0.0 && volume <= 1.0)) {
        reportError(CueError::kOutOfRange, "volume must be within 0..1");
        return;
    }

    if (applyEdit("Set master volume",
                  [volume](cuemix::Project& project, CueError*,
                           std::string*) {
                      project.set_master_volume(static_cast<float>(volume));
                      return true;
                  })) {
        backend_.SetMasterVolume(document_.project().master_volume());
        out_ << "Master volume: " << document_.project().master_volume()
             << "\n";
    }
}

void CueShell::cmdStopAll(const Args& args)
{
    double fadeMs = 0.0;
    if (!args.empty()) {
        // No single sound to take a percentage of.
        const auto fade = cuemix::FadeTime::Parse(args[0]);
        if (!fade.has_value() || fade->unit() == cuemix::FadeUnit::kPercent) {
            reportError(CueError::kInvalidArgument,
                        "stop-all takes an absolute fade such as 500ms or 2s, "
                        "not " + quoted(args[0]));
            return;
        }
        fadeMs = fade->EvaluateMs(0.0);
    }
    backend_.StopAll(fadeMs);
    out_ << "All sounds stopped.\n";
}

// Editing -----------------------------------------------------------------

void CueShell::cmdAddSound(const Args& args)
{
    // Stored absolute: a project reloads relative paths against its own
    // directory, not the shell's working directory.
    const std::string path =
        cuemix::ToStdString(cuemix::ToJuceFile(args[0]).getFullPathName());
    const std::string name = args.size() > 1
                                 ? args[1]
                                 : document_.project().SuggestSoundName(path);
    if (applyEdit("Add sound " + name,
                  [this, &name, &path](cuemix::Project& project,
                                       CueError* error, std::string* detail) {
                      return project.AddSound(name, path, backend_, error,
                                              detail);
                  })) {
        out_ << "Added sound " << quoted(name) << "\n";
    }
}

void CueShell::cmdRenameSound(const Args& args)
{
    const std::string& from = args[0];
    const std::string& to = args[1];
    if (applyEdit("Rename sound " + from,
                  [&from, &to](cuemix::Project& project, CueError* error,
                               std::string*) {
                      return project.RenameSound(from, to, error);
                  })) {
        out_ << "Renamed sound " << quoted(from) << " to " << quoted(to)
             << "\n";
    }
}

void CueShell::cmdRemoveSound(const Args& args)
{
    const std::string& name = args[0];
    const std::size_t uses = document_.project().CountSoundReferences(name);
    if (applyEdit("Remove sound " + name,
                  [&name, uses](cuemix::Project& project, CueError* error,
                                std::string* detail) {
                      if (!project.RemoveSound(name, error)) {
                          if (uses > 0) {
                              *detail = "used by " + std::to_string(uses) +
                                        (uses == 1 ? " cue" : " cues");
                          }
                          return false;
                      }
                      return true;
                  })) {
        releaseUnusedSounds();
        out_ << "Removed sound " << quoted(name) << "\n";
    }
}

void CueShell::cmdAddMixer(const Args& args)
{
    const std::string name =
        args.empty() ? document_.project().NextMixerName() : args[0];
    if (applyEdit("Add mixer " + name,
                  [&name](cuemix::Project& project, CueError* error,
                          std::string*) {
                      return project.AddMixer(name, error);
                  })) {
        out_ << "Added mixer " << quoted(name) << "\n";
    }
}

void CueShell::cmdRenameMixer(const Args& args)
{
    const std::string& from = args[0];
    const std::string& to = args[1];
    if (applyEdit("Rename mixer " + from,
                  [&from, &to](cuemix::Project& project, CueError* error,
                               std::string*) {
                      return project.RenameMixer(from, to, error);
                  })) {
        out_ << "Renamed mixer " << quoted(from) << " to " << quoted(to)
             << "\n";
    }
}

void CueShell::cmdRemoveMixer(const Args& args)
{
    const std::string& name = args[0];
    if (applyEdit("Remove mixer " + name,
                  [&name](cuemix::Project& project, CueError* error,
                          std::string*) {
                      return project.RemoveMixer(name, error);
                  })) {
        out_ << "Removed mixer " << quoted(name) << "\n";
    }
}

void CueShell::cmdAddCue(const Args& args)
{
    const cuemix::Mixer* const mixer = findMixer(args[0]);
    if (mixer == nullptr) {
        return;
    }
    const auto action = cuemix::ParseCueAction(args[1]);
    if (!action.has_value()) {
        reportError(CueError::kInvalidArgument,
                    "action must be play or stop, not " + quoted(args[1]));
        return;
    }

    const std::string mixerName = mixer->name();
    const std::string sound = args.size() > 2 ? args[2] : std::string();
    const std::string cueName =
        args.size() > 3 ? args[3]
                        : "Cue " + std::to_string(mixer->cue_count() + 1);
    if (applyEdit("Add cue " + cueName,
                  [&](cuemix::Project& project, CueError* error,
                      std::string* detail) {
                      if (!project.AddCue(mixerName, cueName, *action, sound,
                                          error)) {
                          *detail = "no sound " + quoted(sound);
                          return false;
                      }
                      return true;
                  })) {
        out_ << "Added cue " << quoted(cueName) << " to "
             << quoted(mixerName) << "\n";
    }
}

void CueShell::cmdDeleteCue(const Args& args)
{
    const cuemix::Mixer* const mixer = findMixer(args[0]);
    std::size_t index = 0;
    if (mixer == nullptr || !parseCueNumber(args[1], *mixer, index)) {
        return;
    }
    const std::string mixerName = mixer->name();
    if (applyEdit("Delete cue",
                  [&mixerName, index](cuemix::Project& project,
                                      CueError* error, std::string*) {
                      return project.FindMixer(mixerName)->DeleteCue(index,
                                                                     error);
                  })) {
        out_ << "Deleted cue " << (index + 1) << " of " << quoted(mixerName)
             << "\n";
    }
}

void CueShell::cmdMoveCue(const Args& args)
{
    const cuemix::Mixer* const mixer = findMixer(args[0]);
    std::size_t from = 0;
    std::size_t to = 0;
    if (mixer == nullptr || !parseCueNumber(args[1], *mixer, from) ||
        !parseCueNumber(args[2], *mixer, to)) {
        return;
    }
    const std::string mixerName = mixer->name();
    if (applyEdit("Move cue",
                  [&mixerName, from, to](cuemix::Project& project,
                                         CueError* error, std::string*) {
                      return project.FindMixer(mixerName)->MoveCue(from, to,
                                                                   error);
                  })) {
        out_ << "Moved cue " << (from + 1) << " to position " << (to + 1)
             << "\n";
    }
}

void CueShell::cmdSetFade(const Args& args)
{
    const cuemix::Mixer* const mixer = findMixer(args[0]);
    std::size_t index = 0;
    if (mixer == nullptr || !parseCueNumber(args[1], *mixer, index)) {
        return;
    }
    const auto fade = cuemix::FadeTime::Parse(args[2]);
    if (!fade.has_value()) {
        reportError(CueError::kInvalidArgument,
                    "malformed fade " + quoted(args[2]) +
                        "; use e.g. 250ms, 1.5s, 2m or 10%");
        return;
    }
    const std::string mixerName = mixer->name();
    const cuemix::FadeTime value = *fade;
    if (applyEdit("Set fade",
                  [&mixerName, index, value](cuemix::Project& project,
                                             CueError* error, std::string*) {
                      return project.FindMixer(mixerName)->SetCueFade(
                          index, value, error);
                  })) {
        out_ << "Cue " << (index + 1) << " fade " << value.ToString()
             << "\n";
    }
}

void CueShell::cmdSetSound(const Args& args)
{
    const cuemix::Mixer* const mixer = findMixer(args[0]);
    std::size_t index = 0;
    if (mixer == nullptr || !parseCueNumber(args[1], *mixer, index)) {
        return;
    }
    const std::string mixerName = mixer->name();
    const std::string sound = args.size() > 2 ? args[2] : std::string();
    if (applyEdit("Set cue sound",
                  [&mixerName, index, &sound](cuemix::Project& project,
                                              CueError* error,
                                              std::string* detail) {
                      if (!project.AssignCueSound(mixerName, index, sound,
                                                  error)) {
                          *detail = "no sound " + quoted(sound);
                          return false;
                      }
                      return true;
                  })) {
        out_ << "Cue " << (index + 1) << " sound "
             << (sound.empty() ? "cleared" : quoted(sound)) << "\n";
    }
}

void CueShell::cmdSetAction(const Args& args)
{
    const cuemix::Mixer* const mixer = findMixer(args[0]);
    std::size_t index = 0;
    if (mixer == nullptr || !parseCueNumber(args[1], *mixer, index)) {
        return;
    }
    const auto action = cuemix::ParseCueAction(args[2]);
    if (!action.has_value()) {
        reportError(CueError::kInvalidArgument,
                    "action must be play or stop, not " + quoted(args[2]));
        return;
    }
    const std::string mixerName = mixer->name();
    const cuemix::CueAction value = *action;
    if (applyEdit("Set cue action",
                  [&mixerName, index, value](cuemix::Project& project,
                                             CueError* error, std::string*) {
                      return project.FindMixer(mixerName)->SetCueAction(
                          index, value, error);
                  })) {
        out_ << "Cue " << (index + 1) << " action "
             << cuemix::CueActionName(value) << "\n";
    }
}

void CueShell::cmdRenameCue(const Args& args)
{
    const cuemix::Mixer* const mixer = findMixer(args[0]);
    std::size_t index = 0;
    if (mixer == nullptr || !parseCueNumber(args[1], *mixer, index)) {
        return;
    }
    const std::string mixerName = mixer->name();
    const std::string& name = args[2];
    if (applyEdit("Rename cue",
                  [&mixerName, index, &name](cuemix::Project& project,
                                             CueError* error, std::string*) {
                      return project.FindMixer(mixerName)->SetCueName(
                          index, name, error);
                  })) {
        out_ << "Cue " << (index + 1) << " renamed to " << quoted(name)
             << "\n";
    }
}

void CueShell::cmdUndo(const Args&)
{
    auto& history = document_.history();
    const std::string description = history.UndoDescription();
    if (!history.Undo()) {
        out_ << "Nothing to undo.\n";
        return;
    }
    backend_.SetMasterVolume(document_.project().master_volume());
    releaseUnusedSounds();
    out_ << "Undid: " << description << "\n";
}

void CueShell::cmdRedo(const Args&)
{
    auto& history = document_.history();
    const std::string description = history.RedoDescription();
    if (!history.Redo()) {
        out_ << "Nothing to redo.\n";
        return;
    }
    backend_.SetMasterVolume(document_.project().master_volume());
    releaseUnusedSounds();
    out_ << "Redid: " << description << "\n";
}

// Files -------------------------------------------------------------------

void CueShell::cmdNew(const Args& args)
{
    if (refuseWithUnsavedChanges("new")) {
        return;
    }
    cmdForceNew(args);
}

void CueShell::cmdForceNew(const Args&)
{
    backend_.StopAll(0.0);
    document_.New();
    backend_.SetMasterVolume(document_.project().master_volume());
    releaseUnusedSounds();
    out_ << "New project.\n";
}

void CueShell::cmdOpen(const Args& args)
{
    if (refuseWithUnsavedChanges("open")) {
        return;
    }
    openDocument(args[0]);
}

void CueShell::cmdForceOpen(const Args& args)
{
    openDocument(args[0]);
}

void CueShell::openDocument(const std::string& path)
{
    CueError error = CueError::kNone;
    std::string detail;
    if (!document_.Open(path, &error, &detail)) {
        reportError(error, detail);
        return;
    }
    backend_.StopAll(0.0);
    syncBackend();
    out_ << "Opened " << document_.path() << "\n";
    if (onDocumentPathChanged) {
        onDocumentPathChanged(document_.path());
    }
}

void CueShell::cmdSave(const Args& args)
{
    CueError error = CueError::kNone;
    std::string detail;
    const bool saveAs = !args.empty();
    const bool saved = saveAs ? document_.SaveAs(args[0], &error, &detail)
                              : document_.Save(&error, &detail);
    if (!saved) {
        reportError(error, detail);
        return;
    }
    out_ << "Saved " << document_.path() << "\n";
    if (saveAs && onDocumentPathChanged) {
        onDocumentPathChanged(document_.path());
    }
}

void CueShell::cmdExport(const Args& args)
{
    const std::string path = cuemix::WithBundleExtension(args[0]);
    CueError error = CueError::kNone;
    std::string detail;
    if (!cuemix::ExportProjectBundle(document_.project(), path, &error,
                                     &detail)) {
        reportError(error, detail);
        return;
    }
    out_ << "Exported " << path << "\n";
}
