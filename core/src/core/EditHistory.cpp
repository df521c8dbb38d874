#include "core/EditHistory.h"

#include <cstddef>
#include <map>
#include <utility>

#include "core/ProjectSerialization.h"
#include "core/StringConversions.h"

namespace cuemix {

namespace {

// Replaces `target` with `snapshot` but carries over the cursors of
// mixers present in both.
void RestoreKeepingCursors(Project& target, const Project& snapshot)
{
  std::map<std::string, std::size_t> live_cursors;
  for (const auto& mixer : target.mixers()) {
    live_cursors[mixer.name()] = mixer.cursor();
  }

  target = snapshot;
  for (const auto& [name, cursor] : live_cursors) {
    if (Mixer* const mixer = target.FindMixer(name)) {
      mixer->RestoreCursor(cursor);
    }
  }
}

class ProjectStateAction : public juce::UndoableAction {
 public:
  ProjectStateAction(Project& target, Project before, Project after)
      : target_(target), before_(std::move(before)), after_(std::move(after))
  {
  }

  bool perform() override
  {
    if (!performed_) {
      // The edit has just run; adopt its result verbatim.
      target_ = after_;
      performed_ = true;
    } else {
      RestoreKeepingCursors(target_, after_);
    }
    return true;
  }

  bool undo() override
  {
    RestoreKeepingCursors(target_, before_);
    return true;
  }

  int getSizeInUnits() override
  {
    return static_cast<int>(before_.mixers().size() +
                            before_.sounds().size()) +
           1;
  }

 private:
  Project& target_;
  Project before_;
  Project after_;
  bool performed_{false};
};

}  // namespace

EditHistory::EditHistory(Project& project) : project_(project) {}

bool EditHistory::Apply(const std::string& description, const Edit& edit)
{
  Project edited = project_;
  if (!edit(edited)) {
    return false;
  }

  if (SerializeProject(edited) == SerializeProject(project_)) {
    project_ = std::move(edited);
    return true;
  }

  manager_.beginNewTransaction(ToJuceString(description));
  return manager_.perform(
      new ProjectStateAction(project_, project_, std::move(edited)));
}

bool EditHistory::Undo()
{
  if (!manager_.canUndo()) {
    return false;
  }
  return manager_.undo();
}

bool EditHistory::Redo()
{
  if (!manager_.canRedo()) {
    return false;
  }
  return manager_.redo();
}

std::string EditHistory::UndoDescription() const
{
  return ToStdString(manager_.getUndoDescription());
}

std::string EditHistory::RedoDescription() const
{
  return ToStdString(manager_.getRedoDescription());
}

void EditHistory::Clear()
{
  manager_.clearUndoHistory();
}

}  // namespace cuemix
