#pragma once

#include <optional>
#include <string>
#include <utility>

#include "core/FadeTime.h"

namespace cuemix {

class PlaybackBackend;
struct Sound;

enum class CueAction {
  kPlay = 0,
  kStop,
};

// Lower-case identifier used in project files and the console shell
// ("play", "stop").
[[nodiscard]] const char* CueActionName(CueAction action);

// Case-insensitive inverse of CueActionName.
[[nodiscard]] std::optional<CueAction> ParseCueAction(const std::string& text);

// One step of a mixer: an action applied to a sound, referenced by
// name. An empty sound name means the cue has not been assigned yet;
// such a cue is skipped silently when executed.
class Cue {
 public:
  Cue() = default;
  Cue(std::string name, CueAction action, std::string sound_name,
      FadeTime fade = FadeTime());

  [[nodiscard]] const std::string& name() const { return name_; }
  [[nodiscard]] CueAction action() const { return action_; }
  [[nodiscard]] const std::string& sound_name() const { return sound_name_; }
  [[nodiscard]] const FadeTime& fade() const { return fade_; }
  [[nodiscard]] bool has_sound() const { return !sound_name_.empty(); }

  void set_name(std::string name) { name_ = std::move(name); }
  void set_action(CueAction action) { action_ = action; }
  void set_sound_name(std::string sound_name)
  {
    sound_name_ = std::move(sound_name);
  }
  void set_fade(const FadeTime& fade) { fade_ = fade; }

  // Issues the cue's action for an already resolved sound.
  void Trigger(const Sound& sound, PlaybackBackend& backend) const;

  [[nodiscard]] bool operator==(const Cue& other) const {
    return name_ == other.name_ && action_ == other.action_ &&
           sound_name_ == other.sound_name_ && fade_ == other.fade_;
  }

  [[nodiscard]] bool operator!=(const Cue& other) const {
    return !(*this == other);
  }

 private:
  std::string name_;
  CueAction action_{CueAction::kPlay};
  std::string sound_name_;
  FadeTime fade_;
};

}  // namespace cuemix
