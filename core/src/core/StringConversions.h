#pragma once

#include <string>

#include <juce_core/juce_core.h>

namespace cuemix {

// The model stores UTF-8 std::string; JUCE APIs take juce::String.
inline juce::String ToJuceString(const std::string& text)
{
  return juce::String::fromUTF8(text.data(), static_cast<int>(text.size()));
}

// Relative paths are taken from the current working directory.
inline juce::File ToJuceFile(const std::string& path)
{
  return juce::File::getCurrentWorkingDirectory().getChildFile(
      ToJuceString(path));
}

inline std::string ToStdString(const juce::String& text)
{
  return text.toStdString();
}

}  // namespace cuemix
