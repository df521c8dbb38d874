#include "core/Mixer.h"

#include <algorithm>
#include <utility>

#include <juce_core/juce_core.h>

#include "core/PlaybackBackend.h"
#include "core/SoundRegistry.h"
#include "core/StringConversions.h"

namespace cuemix {

Mixer::Mixer(std::string name) : name_(std::move(name)) {}

const Cue* Mixer::cue(const std::size_t index) const
{
  if (index >= cues_.size()) {
    return nullptr;
  }
  return &cues_[index];
}

const Cue* Mixer::active_cue() const
{
  return cue(cursor_);
}

CueDisplayState Mixer::display_state(const std::size_t index) const
{
  if (index < cursor_) {
    return CueDisplayState::kExecuted;
  }
  if (index == cursor_) {
    return CueDisplayState::kActive;
  }
  return CueDisplayState::kPending;
}

Cue& Mixer::AddCue(std::string name, const CueAction action,
                   std::string sound_name)
{
  return AddCue(Cue(std::move(name), action, std::move(sound_name)));
}

Cue& Mixer::AddCue(Cue cue)
{
  cues_.push_back(std::move(cue));
  return cues_.back();
}

bool Mixer::DeleteCue(const std::size_t index, CueError* const error)
{
  if (index >= cues_.size()) {
    SetCueError(error, CueError::kOutOfRange);
    return false;
  }

  cues_.erase(cues_.begin() + static_cast<std::ptrdiff_t>(index));

  // Keep the same cues marked as executed. Deleting the active cue
  // leaves the cursor on its successor (or on the terminal position).
  if (index < cursor_) {
    --cursor_;
  }
  cursor_ = std::min(cursor_, cues_.size());
  return true;
}

bool Mixer::MoveCue(const std::size_t from, const std::size_t to,
                    CueError* const error)
{
  if (from >= cues_.size() || to >= cues_.size()) {
    SetCueError(error, CueError::kOutOfRange);
    return false;
  }
  if (from == to) {
    return true;
  }

  Cue moved = std::move(cues_[from]);
  cues_.erase(cues_.begin() + static_cast<std::ptrdiff_t>(from));
  cues_.insert(cues_.begin() + static_cast<std::ptrdiff_t>(to),
               std::move(moved));
  return true;
}

Cue* Mixer::MutableCue(const std::size_t index, CueError* const error)
{
  if (index >= cues_.size()) {
    SetCueError(error, CueError::kOutOfRange);
    return nullptr;
  }
  return &cues_[index];
}

bool Mixer::SetCueName(const std::size_t index, std::string name,
                       CueError* const error)
{
  Cue* const target = MutableCue(index, error);
  if (target == nullptr) {
    return false;
  }
  target->set_name(std::move(name));
  return true;
}

bool Mixer::SetCueAction(const std::size_t index, const CueAction action,
                         CueError* const error)
{
  Cue* const target = MutableCue(index, error);
  if (target == nullptr) {
    return false;
  }
  target->set_action(action);
  return true;
}

bool Mixer::SetCueSound(const std::size_t index, std::string sound_name,
                        CueError* const error)
{
  Cue* const target = MutableCue(index, error);
  if (target == nullptr) {
    return false;
  }
  target->set_sound_name(std::move(sound_name));
  return true;
}

bool Mixer::SetCueFade(const std::size_t index, const FadeTime& fade,
                       CueError* const error)
{
  Cue* const target = MutableCue(index, error);
  if (target == nullptr) {
    return false;
  }
  target->set_fade(fade);
  return true;
}

std::size_t Mixer::CountSoundReferences(const std::string& sound_name) const
{
  return static_cast<std::size_t>(std::count_if(
      cues_.begin(), cues_.end(), [&sound_name](const Cue& cue) {
        return cue.has_sound() && cue.sound_name() == sound_name;
      }));
}

void Mixer::RenameSoundReferences(const std::string& old_name,
                                  const std::string& new_name)
{
  for (auto& cue : cues_) {
    if (cue.sound_name() == old_name) {
      cue.set_sound_name(new_name);
    }
  }
}

bool Mixer::Execute(const SoundRegistry& sounds, PlaybackBackend& backend,
                    CueError* const error)
{
  if (finished()) {
    SetCueError(error, CueError::kNothingToExecute);
    return false;
  }

  const Cue& current = cues_[cursor_];
  if (current.has_sound()) {
    const Sound* const sound = sounds.Find(current.sound_name());
    if (sound == nullptr) {
      juce::Logger::writeToLog(
          "[cuemix-core] Mixer '" + ToJuceString(name_) + "': cue '" +
          ToJuceString(current.name()) + "' references unknown sound '" +
          ToJuceString(current.sound_name()) + "'");
      SetCueError(error, CueError::kNotFound);
      return false;
    }
    current.Trigger(*sound, backend);
  }

  ++cursor_;
  return true;
}

bool Mixer::Back(CueError* const error)
{
  if (cursor_ == 0U) {
    SetCueError(error, CueError::kAlreadyAtStart);
    return false;
  }
  --cursor_;
  return true;
}

bool Mixer::JumpTo(const std::size_t index, CueError* const error)
{
  if (index >= cues_.size()) {
    SetCueError(error, CueError::kOutOfRange);
    return false;
  }
  cursor_ = index;
  return true;
}

void Mixer::RestoreCursor(const std::size_t cursor)
{
  cursor_ = std::min(cursor, cues_.size());
}

}  // namespace cuemix
