#include "core/FadeTime.h"

#include <array>
#include <charconv>
#include <exception>
#include <string>
#include <system_error>
#include <string_view>

namespace cuemix {
namespace {

constexpr std::string_view kNumberChars = "0123456789.-+";

struct UnitSuffix {
  const char* suffix;
  FadeUnit unit;
};

// "ms" must be matched before "m".
constexpr UnitSuffix kUnitSuffixes[] = {
    {"ms", FadeUnit::kMilliseconds},
    {"s", FadeUnit::kSeconds},
    {"m", FadeUnit::kMinutes},
    {"%", FadeUnit::kPercent},
};

const char* SuffixFor(const FadeUnit unit)
{
  for (const auto& entry : kUnitSuffixes) {
    if (entry.unit == unit) {
      return entry.suffix;
    }
  }
  return "s";
}

}  // namespace

FadeTime::FadeTime(const double amount, const FadeUnit unit)
    : amount_(amount), unit_(unit) {}

std::optional<FadeTime> FadeTime::Parse(const std::string& text)
{
  std::size_t split = 0;
  while (split < text.size() &&
         kNumberChars.find(text[split]) != std::string_view::npos) {
    ++split;
  }
  if (split == 0) {
    return std::nullopt;
  }

  const std::string number_part = text.substr(0, split);
  const std::string unit_part = text.substr(split);

  double amount = 0.0;
  try {
    std::size_t consumed = 0;
    amount = std::stod(number_part, &consumed);
    if (consumed != number_part.size()) {
      return std::nullopt;
    }
  } catch (const std::exception&) {
    return std::nullopt;
  }

  if (amount < 0.0) {
    return std::nullopt;
  }

  for (const auto& entry : kUnitSuffixes) {
    if (unit_part == entry.suffix) {
      return FadeTime(amount, entry.unit);
    }
  }
  return std::nullopt;
}

std::string FadeTime::ToString() const
{
  // Plain decimal digits only: Parse has no exponent syntax. The shortest
  // fixed form reads back to the same double.
  std::array<char, 400> digits{};
  const auto result = std::to_chars(digits.data(),
                                    digits.data() + digits.size(), amount_,
                                    std::chars_format::fixed);
  if (result.ec != std::errc()) {
    return std::string("0") + SuffixFor(unit_);
  }
  return std::string(digits.data(), result.ptr) + SuffixFor(unit_);
}

double FadeTime::EvaluateMs(const double sound_length_ms) const
{
  switch (unit_) {
    case FadeUnit::kMilliseconds:
      return amount_;
    case FadeUnit::kSeconds:
      return amount_ * 1000.0;
    case FadeUnit::kMinutes:
      return amount_ * 1000.0 * 60.0;
    case FadeUnit::kPercent:
      return sound_length_ms > 0.0 ? sound_length_ms * (amount_ / 100.0)
                                   : 0.0;
  }
  return 0.0;
}

}  // namespace cuemix
