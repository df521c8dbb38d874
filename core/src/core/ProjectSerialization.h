#pragma once

#include <string>

#include "core/CueError.h"
#include "core/Project.h"

namespace cuemix {

// XML project format (version 1), produced and parsed with JUCE:
//
//   <CUEMIX_PROJECT version="1">
//     <MASTER volume="1"/>
//     <SOUNDS><SOUND name="bell" path="sounds/bell.wav"/></SOUNDS>
//     <MIXERS>
//       <MIXER name="M1">
//         <CUE name="Cue 1" action="play" sound="bell" fade="0s"/>
//       </MIXER>
//     </MIXERS>
//   </CUEMIX_PROJECT>
//
// Cursors are runtime state and are never written; every loaded mixer
// starts at its first cue.

inline constexpr int kProjectFormatVersion = 1;
inline constexpr const char* kProjectFileExtension = ".cuemix";

[[nodiscard]] std::string SerializeProject(const Project& project);

// Replaces `project` only on success. Fails with kParseError for text
// that is not well-formed XML and kSchemaError for a document that does
// not describe a valid project. Relative sound paths are resolved
// against `base_directory` when it is not empty.
[[nodiscard]] bool DeserializeProject(const std::string& text,
                                      const std::string& base_directory,
                                      Project& project, CueError* error,
                                      std::string* error_message);

[[nodiscard]] bool DeserializeProject(const std::string& text,
                                      Project& project, CueError* error,
                                      std::string* error_message);

// `path` with its extension replaced by ".cuemix" when it has another
// one (or none).
[[nodiscard]] std::string WithProjectExtension(const std::string& path);

// Writes the serialized project to exactly `path`, creating parent
// directories. Fails with kWriteFailed.
[[nodiscard]] bool SaveProjectToFile(const Project& project,
                                     const std::string& path,
                                     CueError* error,
                                     std::string* error_message);

// Fails with kNotFound when the file does not exist, otherwise as
// DeserializeProject with the file's directory as base.
[[nodiscard]] bool LoadProjectFromFile(const std::string& path,
                                       Project& project, CueError* error,
                                       std::string* error_message);

}  // namespace cuemix
