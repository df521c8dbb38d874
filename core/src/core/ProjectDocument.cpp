#include "core/ProjectDocument.h"

#include <cctype>
#include <filesystem>
#include <utility>

#include "core/ProjectBundle.h"
#include "core/ProjectSerialization.h"

namespace cuemix {

namespace {

bool HasBundleExtension(const std::string& path)
{
  std::string extension = std::filesystem::path(path).extension().string();
  for (auto& c : extension) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return extension == kBundleFileExtension;
}

}  // namespace

ProjectDocument::ProjectDocument() : history_(project_)
{
  MarkClean();
}

std::string ProjectDocument::DisplayName() const
{
  if (path_.empty()) {
    return "Untitled";
  }
  return std::filesystem::path(path_).filename().string();
}

void ProjectDocument::New()
{
  project_ = Project();
  path_.clear();
  history_.Clear();
  MarkClean();
}

bool ProjectDocument::Open(const std::string& path, CueError* const error,
                           std::string* const error_message)
{
  Project loaded;
  std::string loaded_path = path;
  if (HasBundleExtension(path)) {
    if (!ImportProjectBundle(path, std::string(), loaded, &loaded_path,
                             error, error_message)) {
      return false;
    }
  } else if (!LoadProjectFromFile(path, loaded, error, error_message)) {
    return false;
  }

  project_ = std::move(loaded);
  path_ = loaded_path;
  history_.Clear();
  MarkClean();
  return true;
}

bool ProjectDocument::Save(CueError* const error,
                           std::string* const error_message)
{
  if (path_.empty()) {
    SetCueError(error, CueError::kNotFound);
    if (error_message != nullptr) {
      *error_message = "The project has not been saved yet; give a path";
    }
    return false;
  }
  if (!SaveProjectToFile(project_, path_, error, error_message)) {
    return false;
  }
  MarkClean();
  return true;
}

bool ProjectDocument::SaveAs(const std::string& path, CueError* const error,
                             std::string* const error_message)
{
  if (path.empty()) {
    SetCueError(error, CueError::kInvalidName);
    return false;
  }
  const std::string target = WithProjectExtension(path);
  if (!SaveProjectToFile(project_, target, error, error_message)) {
    return false;
  }
  path_ = target;
  MarkClean();
  return true;
}

bool ProjectDocument::HasUnsavedChanges() const
{
  return SerializeProject(project_) != saved_text_;
}

void ProjectDocument::MarkClean()
{
  saved_text_ = SerializeProject(project_);
}

}  // namespace cuemix
