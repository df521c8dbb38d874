#pragma once

#include <string>

#include "core/CueError.h"
#include "core/EditHistory.h"
#include "core/Project.h"

namespace cuemix {

// The project currently open in a front-end: the model, the file it was
// loaded from or saved to, and the undo history of its edits.
class ProjectDocument {
 public:
  ProjectDocument();

  ProjectDocument(const ProjectDocument&) = delete;
  ProjectDocument& operator=(const ProjectDocument&) = delete;

  [[nodiscard]] Project& project() { return project_; }
  [[nodiscard]] const Project& project() const { return project_; }

  [[nodiscard]] EditHistory& history() { return history_; }

  // Empty until the project has been opened from or saved to a file.
  [[nodiscard]] const std::string& path() const { return path_; }
  [[nodiscard]] bool has_path() const { return !path_.empty(); }

  // File name without directory, or "Untitled".
  [[nodiscard]] std::string DisplayName() const;

  // Replaces the project with an empty one and forgets path and history.
  void New();

  // Loads a .cuemix file, or a .cuemixz bundle extracted next to it. The
  // current project is kept when loading fails.
  [[nodiscard]] bool Open(const std::string& path, CueError* error,
                          std::string* error_message);

  // Fails with kNotFound when the document has no path yet.
  [[nodiscard]] bool Save(CueError* error, std::string* error_message);

  // Saves under `path` (extension forced to .cuemix) and adopts it.
  [[nodiscard]] bool SaveAs(const std::string& path, CueError* error,
                            std::string* error_message);

  // True when the saved content differs from the last open/save. Cursor
  // positions are not content. A new empty project is never dirty.
  [[nodiscard]] bool HasUnsavedChanges() const;

 private:
  void MarkClean();

  Project project_;
  EditHistory history_;
  std::string path_;
  std::string saved_text_;
};

}  // namespace cuemix
