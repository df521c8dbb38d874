#include "core/SoundRegistry.h"

#include <algorithm>
#include <utility>

#include "core/PlaybackBackend.h"

namespace cuemix {

bool SoundRegistry::Add(const std::string& name, const std::string& path,
                        PlaybackBackend& backend, CueError* const error,
                        std::string* const error_message)
{
  if (name.empty()) {
    SetCueError(error, CueError::kInvalidName);
    return false;
  }
  if (Contains(name)) {
    SetCueError(error, CueError::kDuplicateName);
    return false;
  }

  std::string load_error;
  if (!backend.Preload(path, &load_error)) {
    SetCueError(error, CueError::kFileUnreadable);
    if (error_message != nullptr) {
      *error_message = load_error;
    }
    return false;
  }

  sounds_.push_back(Sound{name, path});
  return true;
}

bool SoundRegistry::Insert(Sound sound, CueError* const error)
{
  if (sound.name.empty()) {
    SetCueError(error, CueError::kInvalidName);
    return false;
  }
  if (Contains(sound.name)) {
    SetCueError(error, CueError::kDuplicateName);
    return false;
  }
  sounds_.push_back(std::move(sound));
  return true;
}

bool SoundRegistry::Rename(const std::string& old_name,
                           const std::string& new_name,
                           CueError* const error)
{
  Sound* const sound = FindMutable(old_name);
  if (sound == nullptr) {
    SetCueError(error, CueError::kNotFound);
    return false;
  }
  if (new_name.empty()) {
    SetCueError(error, CueError::kInvalidName);
    return false;
  }
  if (new_name == old_name) {
    return true;
  }
  if (Contains(new_name)) {
    SetCueError(error, CueError::kDuplicateName);
    return false;
  }
  sound->name = new_name;
  return true;
}

bool SoundRegistry::Remove(const std::string& name, CueError* const error)
{
  const auto it = std::find_if(
      sounds_.begin(), sounds_.end(),
      [&name](const Sound& sound) { return sound.name == name; });
  if (it == sounds_.end()) {
    SetCueError(error, CueError::kNotFound);
    return false;
  }
  sounds_.erase(it);
  return true;
}

bool SoundRegistry::SetPath(const std::string& name, std::string path,
                            CueError* const error)
{
  Sound* const sound = FindMutable(name);
  if (sound == nullptr) {
    SetCueError(error, CueError::kNotFound);
    return false;
  }
  sound->path = std::move(path);
  return true;
}

const Sound* SoundRegistry::Find(const std::string& name) const
{
  for (const auto& sound : sounds_) {
    if (sound.name == name) {
      return &sound;
    }
  }
  return nullptr;
}

Sound* SoundRegistry::FindMutable(const std::string& name)
{
  for (auto& sound : sounds_) {
    if (sound.name == name) {
      return &sound;
    }
  }
  return nullptr;
}

std::vector<std::string> SoundRegistry::names() const
{
  std::vector<std::string> result;
  result.reserve(sounds_.size());
  for (const auto& sound : sounds_) {
    result.push_back(sound.name);
  }
  return result;
}

}  // namespace cuemix
