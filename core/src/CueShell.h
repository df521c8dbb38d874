#pragma once

#include <cstddef>
#include <functional>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "core/CueError.h"
#include "core/PlaybackBackend.h"
#include "core/Project.h"
#include "core/ProjectDocument.h"

// Line-oriented operator console for running and editing a show.
//
// One command per line; arguments containing spaces are quoted. Cue
// numbers are 1-based. Edits go through the document's EditHistory so
// they can be undone; sequencer moves (go/back/reset/jump) do not.
class CueShell {
public:
    CueShell(cuemix::ProjectDocument& document,
             cuemix::PlaybackBackend& backend, std::ostream& out);

    // Runs one command line. Returns false once the shell should exit.
    bool execute(const std::string& line);

    // Prompts and executes lines from `in` until quit or end of input.
    void run(std::istream& in);

    [[nodiscard]] bool quitRequested() const noexcept { return quit_; }

    // Project overview: status, sounds and every mixer's cue list.
    void printSummary();

    // Pushes the project's master volume to the backend and preloads its
    // sounds, reporting the ones that cannot be played. Called after a
    // project has been opened outside the shell.
    void syncBackend();

    // Invoked after the document path changes (open, save as).
    std::function<void(const std::string&)> onDocumentPathChanged;

private:
    using Args = std::vector<std::string>;
    using Handler = void (CueShell::*)(const Args&);
    using Edit = std::function<bool(cuemix::Project&, cuemix::CueError*,
                                    std::string*)>;

    struct Command {
        const char* name;
        const char* usage;
        const char* help;
        std::size_t minArgs;
        Handler handler;
    };

    static const std::vector<Command>& commands();

    // Lets the backend drop preloaded files the project no longer names.
    void releaseUnusedSounds();

    // Session.
    void cmdHelp(const Args& args);
    void cmdStatus(const Args& args);
    void cmdSounds(const Args& args);
    void cmdMixers(const Args& args);
    void cmdShow(const Args& args);
    void cmdQuit(const Args& args);
    void cmdForceQuit(const Args& args);

    // Show control.
    void cmdGo(const Args& args);
    void cmdBack(const Args& args);
    void cmdReset(const Args& args);
    void cmdJump(const Args& args);
    void cmdVolume(const Args& args);
    void cmdStopAll(const Args& args);

    // Editing.
    void cmdAddSound(const Args& args);
    void cmdRenameSound(const Args& args);
    void cmdRemoveSound(const Args& args);
    void cmdAddMixer(const Args& args);
    void cmdRenameMixer(const Args& args);
    void cmdRemoveMixer(const Args& args);
    void cmdAddCue(const Args& args);
    void cmdDeleteCue(const Args& args);
    void cmdMoveCue(const Args& args);
    void cmdSetFade(const Args& args);
    void cmdSetSound(const Args& args);
    void cmdSetAction(const Args& args);
    void cmdRenameCue(const Args& args);
    void cmdUndo(const Args& args);
    void cmdRedo(const Args& args);

    // Files.
    void cmdNew(const Args& args);
    void cmdForceNew(const Args& args);
    void cmdOpen(const Args& args);
    void cmdForceOpen(const Args& args);
    void cmdSave(const Args& args);
    void cmdExport(const Args& args);

    static Args tokenize(const std::string& line);

    bool applyEdit(const std::string& description, const Edit& edit);
    void reportError(cuemix::CueError error,
                     const std::string& detail = {});

    // Looks the mixer up and reports kNotFound when it is missing.
    cuemix::Mixer* findMixer(const std::string& name);

    // Converts a 1-based cue number; reports kOutOfRange when invalid.
    bool parseCueNumber(const std::string& text,
                        const cuemix::Mixer& mixer, std::size_t& index);

    bool refuseWithUnsavedChanges(const char* command);
    void openDocument(const std::string& path);
    void printMixer(const cuemix::Mixer& mixer);
    void printMixerPosition(const cuemix::Mixer& mixer);

    cuemix::ProjectDocument& document_;
    cuemix::PlaybackBackend& backend_;
    std::ostream& out_;
    bool quit_{false};
};
