#include "core/Cue.h"

#include <algorithm>
#include <cctype>
#include <utility>

#include "core/PlaybackBackend.h"
#include "core/SoundRegistry.h"

namespace cuemix {

const char* CueActionName(const CueAction action)
{
  switch (action) {
    case CueAction::kPlay:
      return "play";
    case CueAction::kStop:
      return "stop";
  }
  return "play";
}

std::optional<CueAction> ParseCueAction(const std::string& text)
{
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });
  if (lower == "play") {
    return CueAction::kPlay;
  }
  if (lower == "stop") {
    return CueAction::kStop;
  }
  return std::nullopt;
}

Cue::Cue(std::string name, const CueAction action, std::string sound_name,
         const FadeTime fade)
    : name_(std::move(name)),
      action_(action),
      sound_name_(std::move(sound_name)),
      fade_(fade) {}

void Cue::Trigger(const Sound& sound, PlaybackBackend& backend) const
{
  // Only percent fades need the decoded length; skip the lookup otherwise.
  const double length_ms = fade_.unit() == FadeUnit::kPercent
                               ? backend.GetLengthMs(sound.path)
                               : 0.0;
  const double fade_ms = fade_.EvaluateMs(length_ms);

  switch (action_) {
    case CueAction::kPlay:
      backend.Play(sound, fade_ms);
      break;
    case CueAction::kStop:
      backend.Stop(sound, fade_ms);
      break;
  }
}

}  // namespace cuemix
