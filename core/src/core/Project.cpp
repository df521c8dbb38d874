#include "core/Project.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <utility>

#include "core/PlaybackBackend.h"

namespace cuemix {

void Project::set_master_volume(const float volume)
{
  // std::clamp passes NaN through.
  master_volume_ =
      std::isnan(volume) ? 0.0F : std::clamp(volume, 0.0F, 1.0F);
}

bool Project::AddSound(const std::string& name, const std::string& path,
                       PlaybackBackend& backend, CueError* const error,
                       std::string* const error_message)
{
  return sounds_.Add(name, path, backend, error, error_message);
}

bool Project::InsertSound(Sound sound, CueError* const error)
{
  return sounds_.Insert(std::move(sound), error);
}

bool Project::RenameSound(const std::string& old_name,
                          const std::string& new_name, CueError* const error)
{
  if (!sounds_.Rename(old_name, new_name, error)) {
    return false;
  }
  for (auto& mixer : mixers_) {
    mixer.RenameSoundReferences(old_name, new_name);
  }
  return true;
}

bool Project::RemoveSound(const std::string& name, CueError* const error)
{
  if (!sounds_.Contains(name)) {
    SetCueError(error, CueError::kNotFound);
    return false;
  }
  if (CountSoundReferences(name) > 0U) {
    SetCueError(error, CueError::kInUse);
    return false;
  }
  return sounds_.Remove(name, error);
}

bool Project::RelocateSound(const std::string& name,
                            const std::string& path, CueError* const error)
{
  return sounds_.SetPath(name, path, error);
}

std::size_t Project::CountSoundReferences(const std::string& name) const
{
  std::size_t count = 0U;
  for (const auto& mixer : mixers_) {
    count += mixer.CountSoundReferences(name);
  }
  return count;
}

std::string Project::SuggestSoundName(const std::string& path) const
{
  std::string base = std::filesystem::path(path).stem().string();
  if (base.empty()) {
    base = "Sound";
  }
  if (!sounds_.Contains(base)) {
    return base;
  }
  for (int suffix = 2;; ++suffix) {
    std::string candidate = base + " (" + std::to_string(suffix) + ")";
    if (!sounds_.Contains(candidate)) {
      return candidate;
    }
  }
}

Mixer* Project::FindMixer(const std::string& name)
{
  for (auto& mixer : mixers_) {
    if (mixer.name() == name) {
      return &mixer;
    }
  }
  return nullptr;
}

const Mixer* Project::FindMixer(const std::string& name) const
{
  for (const auto& mixer : mixers_) {
    if (mixer.name() == name) {
      return &mixer;
    }
  }
  return nullptr;
}

bool Project::AddMixer(const std::string& name, CueError* const error)
{
  if (name.empty()) {
    SetCueError(error, CueError::kInvalidName);
    return false;
  }
  if (FindMixer(name) != nullptr) {
    SetCueError(error, CueError::kDuplicateName);
    return false;
  }
  mixers_.emplace_back(name);
  return true;
}

bool Project::RemoveMixer(const std::string& name, CueError* const error)
{
  const auto it = std::find_if(
      mixers_.begin(), mixers_.end(),
      [&name](const Mixer& mixer) { return mixer.name() == name; });
  if (it == mixers_.end()) {
    SetCueError(error, CueError::kNotFound);
    return false;
  }
  mixers_.erase(it);
  return true;
}

bool Project::RenameMixer(const std::string& old_name,
                          const std::string& new_name, CueError* const error)
{
  Mixer* const mixer = FindMixer(old_name);
  if (mixer == nullptr) {
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
  if (FindMixer(new_name) != nullptr) {
    SetCueError(error, CueError::kDuplicateName);
    return false;
  }
  mixer->set_name(new_name);
  return true;
}

std::string Project::NextMixerName() const
{
  const std::string base = "Mixer";
  if (FindMixer(base) == nullptr) {
    return base;
  }
  for (int suffix = 2;; ++suffix) {
    std::string candidate = base + " " + std::to_string(suffix);
    if (FindMixer(candidate) == nullptr) {
      return candidate;
    }
  }
}

bool Project::AddCue(const std::string& mixer_name,
                     const std::string& cue_name, const CueAction action,
                     const std::string& sound_name, CueError* const error)
{
  Mixer* const mixer = FindMixer(mixer_name);
  if (mixer == nullptr) {
    SetCueError(error, CueError::kNotFound);
    return false;
  }
  if (!sound_name.empty() && !sounds_.Contains(sound_name)) {
    SetCueError(error, CueError::kNotFound);
    return false;
  }
  mixer->AddCue(cue_name, action, sound_name);
  return true;
}

bool Project::AssignCueSound(const std::string& mixer_name,
                             const std::size_t index,
                             const std::string& sound_name,
                             CueError* const error)
{
  Mixer* const mixer = FindMixer(mixer_name);
  if (mixer == nullptr) {
    SetCueError(error, CueError::kNotFound);
    return false;
  }
  if (!sound_name.empty() && !sounds_.Contains(sound_name)) {
    SetCueError(error, CueError::kNotFound);
    return false;
  }
  return mixer->SetCueSound(index, sound_name, error);
}

bool Project::ExecuteCue(const std::string& mixer_name,
                         PlaybackBackend& backend, CueError* const error)
{
  Mixer* const mixer = FindMixer(mixer_name);
  if (mixer == nullptr) {
    SetCueError(error, CueError::kNotFound);
    return false;
  }
  return mixer->Execute(sounds_, backend, error);
}

void Project::ResetAllCursors()
{
  for (auto& mixer : mixers_) {
    mixer.Reset();
  }
}

}  // namespace cuemix
