#pragma once

#include <optional>
#include <string>

namespace cuemix {

enum class FadeUnit {
  kMilliseconds = 0,
  kSeconds,
  kMinutes,
  kPercent,
};

// Fade duration attached to a cue. Written as a non-negative number
// followed by a unit suffix: "250ms", "1.5s", "2m" or "10%". Percent
// values are relative to the length of the sound the cue plays.
class FadeTime {
 public:
  FadeTime() = default;
  FadeTime(double amount, FadeUnit unit);

  // Returns std::nullopt for empty input, unknown units, trailing
  // garbage or negative amounts.
  [[nodiscard]] static std::optional<FadeTime> Parse(const std::string& text);

  [[nodiscard]] std::string ToString() const;

  // Duration in milliseconds. `sound_length_ms` is only consulted for
  // percent values.
  [[nodiscard]] double EvaluateMs(double sound_length_ms) const;

  [[nodiscard]] double amount() const { return amount_; }
  [[nodiscard]] FadeUnit unit() const { return unit_; }
  [[nodiscard]] bool is_zero() const { return amount_ <= 0.0; }

  [[nodiscard]] bool operator==(const FadeTime& other) const {
    return amount_ == other.amount_ && unit_ == other.unit_;
  }

  [[nodiscard]] bool operator!=(const FadeTime& other) const {
    return !(*this == other);
  }

 private:
  double amount_{0.0};
  FadeUnit unit_{FadeUnit::kSeconds};
};

}  // namespace cuemix
