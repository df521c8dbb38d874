#include "core/ProjectSerialization.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <utility>

#include <juce_core/juce_core.h>

#include "core/StringConversions.h"

namespace cuemix {

namespace {

constexpr const char* kRootTag = "CUEMIX_PROJECT";
constexpr const char* kMasterTag = "MASTER";
constexpr const char* kSoundsTag = "SOUNDS";
constexpr const char* kSoundTag = "SOUND";
constexpr const char* kMixersTag = "MIXERS";
constexpr const char* kMixerTag = "MIXER";
constexpr const char* kCueTag = "CUE";

constexpr const char* kNoticeHeader =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<!-- CueMix project file. Written by cuemix; manual edits may be "
    "overwritten on the next save. -->";

bool Fail(const CueError code, const juce::String& message, CueError* error,
          std::string* error_message)
{
  SetCueError(error, code);
  if (error_message != nullptr) {
    *error_message = ToStdString(message);
  }
  return false;
}

std::optional<double> ParseNumber(const juce::String& text)
{
  const std::string raw = ToStdString(text.trim());
  if (raw.empty()) {
    return std::nullopt;
  }
  try {
    std::size_t consumed = 0U;
    const double value = std::stod(raw, &consumed);
    if (consumed != raw.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

// Returns the attribute or std::nullopt when it is missing. Empty
// values are allowed here; callers decide whether they are valid.
std::optional<juce::String> RequiredAttribute(const juce::XmlElement& element,
                                              const char* name)
{
  if (!element.hasAttribute(name)) {
    return std::nullopt;
  }
  return element.getStringAttribute(name);
}

std::string ResolveSoundPath(const juce::String& path,
                             const std::string& base_directory)
{
  if (base_directory.empty() || juce::File::isAbsolutePath(path)) {
    return ToStdString(path);
  }
  return ToStdString(
      ToJuceFile(base_directory).getChildFile(path).getFullPathName());
}

}  // namespace

std::string SerializeProject(const Project& project)
{
  juce::XmlElement root(kRootTag);
  root.setAttribute("version", kProjectFormatVersion);

  auto* master = root.createNewChildElement(kMasterTag);
  master->setAttribute("volume",
                       static_cast<double>(project.master_volume()));

  auto* sounds = root.createNewChildElement(kSoundsTag);
  for (const auto& sound : project.sounds().sounds()) {
    auto* element = sounds->createNewChildElement(kSoundTag);
    element->setAttribute("name", ToJuceString(sound.name));
    element->setAttribute("path", ToJuceString(sound.path));
  }

  auto* mixers = root.createNewChildElement(kMixersTag);
  for (const auto& mixer : project.mixers()) {
    auto* mixer_element = mixers->createNewChildElement(kMixerTag);
    mixer_element->setAttribute("name", ToJuceString(mixer.name()));
    for (const auto& cue : mixer.cues()) {
      auto* cue_element = mixer_element->createNewChildElement(kCueTag);
      cue_element->setAttribute("name", ToJuceString(cue.name()));
      cue_element->setAttribute("action",
                                juce::String(CueActionName(cue.action())));
      cue_element->setAttribute("sound", ToJuceString(cue.sound_name()));
      cue_element->setAttribute("fade", ToJuceString(cue.fade().ToString()));
    }
  }

  auto format = juce::XmlElement::TextFormat();
  format.customHeader = kNoticeHeader;
  format.newLineChars = "\n";
  return ToStdString(root.toString(format));
}

bool DeserializeProject(const std::string& text, Project& project,
                        CueError* const error,
                        std::string* const error_message)
{
  return DeserializeProject(text, std::string(), project, error,
                            error_message);
}

bool DeserializeProject(const std::string& text,
                        const std::string& base_directory, Project& project,
                        CueError* const error,
                        std::string* const error_message)
{
  juce::XmlDocument document(ToJuceString(text));
  const std::unique_ptr<juce::XmlElement> root =
      document.getDocumentElement();
  if (root == nullptr) {
    juce::String detail = document.getLastParseError();
    if (detail.isEmpty()) {
      detail = "document is empty";
    }
    return Fail(CueError::kParseError, "Malformed project XML: " + detail,
                error, error_message);
  }

  if (!root->hasTagName(kRootTag)) {
    return Fail(CueError::kSchemaError,
                "Unexpected root element <" + root->getTagName() + ">",
                error, error_message);
  }
  if (root->getStringAttribute("version").trim() !=
      juce::String(kProjectFormatVersion)) {
    return Fail(CueError::kSchemaError,
                "Unsupported project version '" +
                    root->getStringAttribute("version") + "'",
                error, error_message);
  }

  Project loaded;

  const auto* master = root->getChildByName(kMasterTag);
  if (master == nullptr) {
    return Fail(CueError::kSchemaError, "Missing <MASTER> section", error,
                error_message);
  }
  const auto volume_text = RequiredAttribute(*master, "volume");
  const auto volume =
      volume_text.has_value() ? ParseNumber(*volume_text) : std::nullopt;
  if (!volume.has_value() || !(*volume >= 0.0 && *volume <= 1.0)) {
    return Fail(CueError::kSchemaError,
                "Master volume must be a number between 0 and 1", error,
                error_message);
  }
  loaded.set_master_volume(static_cast<float>(*volume));

  const auto* sounds = root->getChildByName(kSoundsTag);
  if (sounds == nullptr) {
    return Fail(CueError::kSchemaError, "Missing <SOUNDS> section", error,
                error_message);
  }
  for (const auto* element : sounds->getChildIterator()) {
    if (!element->hasTagName(kSoundTag)) {
      return Fail(CueError::kSchemaError,
                  "Unexpected <" + element->getTagName() + "> in <SOUNDS>",
                  error, error_message);
    }
    const auto name = RequiredAttribute(*element, "name");
    const auto path = RequiredAttribute(*element, "path");
    if (!name.has_value() || name->isEmpty() || !path.has_value() ||
        path->isEmpty()) {
      return Fail(CueError::kSchemaError,
                  "<SOUND> requires non-empty name and path", error,
                  error_message);
    }
    Sound sound{ToStdString(*name), ResolveSoundPath(*path, base_directory)};
    if (!loaded.InsertSound(std::move(sound), nullptr)) {
      return Fail(CueError::kSchemaError, "Duplicate sound name '" + *name +
                                              "'",
                  error, error_message);
    }
  }

  const auto* mixers = root->getChildByName(kMixersTag);
  if (mixers == nullptr) {
    return Fail(CueError::kSchemaError, "Missing <MIXERS> section", error,
                error_message);
  }
  for (const auto* mixer_element : mixers->getChildIterator()) {
    if (!mixer_element->hasTagName(kMixerTag)) {
      return Fail(CueError::kSchemaError,
                  "Unexpected <" + mixer_element->getTagName() +
                      "> in <MIXERS>",
                  error, error_message);
    }
    const auto mixer_name = RequiredAttribute(*mixer_element, "name");
    if (!mixer_name.has_value() || mixer_name->isEmpty()) {
      return Fail(CueError::kSchemaError, "<MIXER> requires a name", error,
                  error_message);
    }
    if (!loaded.AddMixer(ToStdString(*mixer_name), nullptr)) {
      return Fail(CueError::kSchemaError,
                  "Duplicate mixer name '" + *mixer_name + "'", error,
                  error_message);
    }
    Mixer* const mixer = loaded.FindMixer(ToStdString(*mixer_name));

    for (const auto* cue_element : mixer_element->getChildIterator()) {
      if (!cue_element->hasTagName(kCueTag)) {
        return Fail(CueError::kSchemaError,
                    "Unexpected <" + cue_element->getTagName() +
                        "> in mixer '" + *mixer_name + "'",
                    error, error_message);
      }
      const auto cue_name = RequiredAttribute(*cue_element, "name");
      const auto action_text = RequiredAttribute(*cue_element, "action");
      const auto sound_name = RequiredAttribute(*cue_element, "sound");
      if (!cue_name.has_value() || !action_text.has_value() ||
          !sound_name.has_value()) {
        return Fail(CueError::kSchemaError,
                    "<CUE> requires name, action and sound attributes in "
                    "mixer '" + *mixer_name + "'",
                    error, error_message);
      }
      const auto action = ParseCueAction(ToStdString(*action_text));
      if (!action.has_value()) {
        return Fail(CueError::kSchemaError,
                    "Unknown cue action '" + *action_text + "'", error,
                    error_message);
      }
      FadeTime fade;
      if (cue_element->hasAttribute("fade")) {
        const auto parsed = FadeTime::Parse(
            ToStdString(cue_element->getStringAttribute("fade")));
        if (!parsed.has_value()) {
          return Fail(CueError::kSchemaError,
                      "Malformed fade time '" +
                          cue_element->getStringAttribute("fade") + "'",
                      error, error_message);
        }
        fade = *parsed;
      }
      const std::string sound = ToStdString(*sound_name);
      if (!sound.empty() && !loaded.sounds().Contains(sound)) {
        return Fail(CueError::kSchemaError,
                    "Cue '" + *cue_name + "' references unknown sound '" +
                        *sound_name + "'",
                    error, error_message);
      }
      mixer->AddCue(Cue(ToStdString(*cue_name), *action, sound, fade));
    }
  }

  project = std::move(loaded);
  return true;
}

std::string WithProjectExtension(const std::string& path)
{
  std::filesystem::path result(path);
  std::string extension = result.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });
  if (extension == kProjectFileExtension) {
    return path;
  }
  result.replace_extension(kProjectFileExtension);
  return result.string();
}

bool SaveProjectToFile(const Project& project, const std::string& path,
                       CueError* const error,
                       std::string* const error_message)
{
  const juce::File file = ToJuceFile(path);
  const auto parent = file.getParentDirectory();
  if (!parent.isDirectory() && !parent.createDirectory().wasOk()) {
    return Fail(CueError::kWriteFailed,
                "Cannot create directory " + parent.getFullPathName(), error,
                error_message);
  }

  const juce::String text = ToJuceString(SerializeProject(project));
  if (!file.replaceWithText(text, false, false, "\n")) {
    juce::Logger::writeToLog("[cuemix-core] Failed to write project file: " +
                             file.getFullPathName());
    return Fail(CueError::kWriteFailed,
                "Cannot write " + file.getFullPathName(), error,
                error_message);
  }

  juce::Logger::writeToLog("[cuemix-core] Saved project to " +
                           file.getFullPathName());
  return true;
}

bool LoadProjectFromFile(const std::string& path, Project& project,
                         CueError* const error,
                         std::string* const error_message)
{
  const juce::File file = ToJuceFile(path);
  if (!file.existsAsFile()) {
    return Fail(CueError::kNotFound,
                "Project file not found: " + file.getFullPathName(), error,
                error_message);
  }

  const juce::String text = file.loadFileAsString();
  std::string detail;
  if (!DeserializeProject(ToStdString(text),
                          ToStdString(file.getParentDirectory()
                                          .getFullPathName()),
                          project, error, &detail)) {
    juce::Logger::writeToLog("[cuemix-core] Failed to load " +
                             file.getFullPathName() + ": " +
                             ToJuceString(detail));
    if (error_message != nullptr) {
      *error_message = detail;
    }
    return false;
  }

  juce::Logger::writeToLog("[cuemix-core] Loaded project " +
                           file.getFullPathName() + " (" +
                           juce::String(static_cast<int>(
                               project.sounds().size())) +
                           " sounds, " +
                           juce::String(static_cast<int>(
                               project.mixers().size())) +
                           " mixers)");
  return true;
}

}  // namespace cuemix
