#include <cassert>
#include <iostream>
#include <string>

#include "RecordingBackend.h"
#include "core/Cue.h"
#include "core/CueError.h"
#include "core/EditHistory.h"
#include "core/Project.h"

// Undo/redo of project edits. Cursors are show state, not content, and
// survive undo and redo wherever the mixer still exists.

using cuemix::CueAction;
using cuemix::CueError;
using cuemix::EditHistory;
using cuemix::Project;

namespace {

EditHistory::Edit AddMixer(const std::string& name)
{
    return [name](Project& project) { return project.AddMixer(name, nullptr); };
}

EditHistory::Edit AddCue(const std::string& mixer, const std::string& cue)
{
    return [mixer, cue](Project& project) {
        return project.AddCue(mixer, cue, CueAction::kPlay, "", nullptr);
    };
}

}  // namespace

int main()
{
    // Empty history.
    {
        Project project;
        EditHistory history(project);
        assert(!history.CanUndo());
        assert(!history.CanRedo());
        assert(!history.Undo());
        assert(!history.Redo());
        assert(history.UndoDescription().empty());
    }

    // Apply, undo, redo.
    {
        Project project;
        EditHistory history(project);

        assert(history.Apply("Add mixer Main", AddMixer("Main")));
        assert(project.FindMixer("Main") != nullptr);
        assert(history.CanUndo());
        assert(history.UndoDescription() == "Add mixer Main");

        assert(history.Apply("Add cue", AddCue("Main", "Intro")));
        assert(history.Apply("Add cue", AddCue("Main", "Bell")));
        assert(project.FindMixer("Main")->cue_count() == 2U);

        assert(history.Undo());
        assert(project.FindMixer("Main")->cue_count() == 1U);
        assert(history.CanRedo());
        assert(history.RedoDescription() == "Add cue");

        assert(history.Undo());
        assert(history.Undo());
        assert(project.FindMixer("Main") == nullptr);
        assert(!history.CanUndo());
        assert(!history.Undo());

        assert(history.Redo());
        assert(history.Redo());
        assert(project.FindMixer("Main")->cue_count() == 1U);
        assert(project.FindMixer("Main")->cue(0U)->name() == "Intro");

        // A new edit discards the redo branch.
        assert(history.Apply("Add mixer FX", AddMixer("FX")));
        assert(!history.CanRedo());
        assert(project.mixers().size() == 2U);
    }

    // Failed and no-op edits leave no trace.
    {
        Project project;
        EditHistory history(project);
        assert(history.Apply("Add mixer", AddMixer("Main")));

        CueError error = CueError::kNone;
        assert(!history.Apply("Duplicate", [&error](Project& p) {
            return p.AddMixer("Main", &error);
        }));
        assert(error == CueError::kDuplicateName);
        assert(project.mixers().size() == 1U);
        assert(history.UndoDescription() == "Add mixer");

        // A partially applied edit that then fails is discarded whole.
        assert(!history.Apply("Half", [](Project& p) {
            const bool added = p.AddMixer("Other", nullptr);
            return added && p.AddMixer("Main", nullptr);
        }));
        assert(project.FindMixer("Other") == nullptr);

        assert(history.Apply("Set volume", [](Project& p) {
            p.set_master_volume(p.master_volume());
            return true;
        }));
        assert(history.UndoDescription() == "Add mixer");

        assert(history.Undo());
        assert(!history.CanUndo());
    }

    // Cursors survive undo and redo, clamped to the restored cue list.
    {
        RecordingBackend backend;
        Project project;
        EditHistory history(project);
        assert(history.Apply("Add mixer", AddMixer("Main")));
        assert(history.Apply("Add mixer", AddMixer("FX")));
        for (const char* name : {"1", "2", "3"}) {
            assert(history.Apply("Add cue", AddCue("Main", name)));
        }
        assert(history.Apply("Add cue", AddCue("FX", "hit")));

        for (int i = 0; i < 3; ++i) {
            assert(project.ExecuteCue("Main", backend, nullptr));
        }
        assert(project.ExecuteCue("FX", backend, nullptr));
        assert(project.FindMixer("Main")->cursor() == 3U);

        // Undoing the last "Add cue" on FX keeps Main where it is and
        // clamps FX to its shorter list.
        assert(history.Undo());
        assert(project.FindMixer("Main")->cursor() == 3U);
        assert(project.FindMixer("FX")->cue_count() == 0U);
        assert(project.FindMixer("FX")->cursor() == 0U);

        // Undoing a cue on Main clamps Main.
        assert(history.Undo());
        assert(project.FindMixer("Main")->cue_count() == 2U);
        assert(project.FindMixer("Main")->cursor() == 2U);

        assert(project.FindMixer("Main")->Back(nullptr));
        assert(history.Redo());
        assert(project.FindMixer("Main")->cue_count() == 3U);
        assert(project.FindMixer("Main")->cursor() == 1U);

        // Cursor movement is not an edit.
        assert(history.RedoDescription() == "Add cue");
    }

    // Clear drops both directions.
    {
        Project project;
        EditHistory history(project);
        assert(history.Apply("Add mixer", AddMixer("A")));
        assert(history.Apply("Add mixer", AddMixer("B")));
        assert(history.Undo());
        history.Clear();
        assert(!history.CanUndo());
        assert(!history.CanRedo());
        assert(project.mixers().size() == 1U);
    }

    std::cout << "cuemix-history-tests: OK" << std::endl;
    return 0;
}
