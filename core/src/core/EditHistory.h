#pragma once

#include <functional>
#include <string>

#include <juce_data_structures/juce_data_structures.h>

#include "core/Project.h"

namespace cuemix {

// Undo/redo for project edits, backed by juce::UndoManager.
//
// Each transaction stores whole-project snapshots taken before and
// after the edit. Sequencer moves (Execute, Back, Reset, JumpTo) are
// not edits and never go through here. Undo and redo keep the live
// cursor of every mixer that still exists by name, clamped to the
// restored cue count, so a running show does not jump back.
class EditHistory {
 public:
  using Edit = std::function<bool(Project&)>;

  explicit EditHistory(Project& project);

  EditHistory(const EditHistory&) = delete;
  EditHistory& operator=(const EditHistory&) = delete;

  // Runs `edit` on a copy of the project. When it returns false the
  // project is left untouched and false is returned. When it succeeds
  // but leaves the saved content unchanged, nothing is recorded.
  [[nodiscard]] bool Apply(const std::string& description, const Edit& edit);

  bool Undo();
  bool Redo();

  [[nodiscard]] bool CanUndo() const { return manager_.canUndo(); }
  [[nodiscard]] bool CanRedo() const { return manager_.canRedo(); }
  [[nodiscard]] std::string UndoDescription() const;
  [[nodiscard]] std::string RedoDescription() const;

  void Clear();

 private:
  Project& project_;
  juce::UndoManager manager_;
};

}  // namespace cuemix
