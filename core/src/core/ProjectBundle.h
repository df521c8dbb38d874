// ProjectBundle: self-contained .cuemixz archives of a project and its
// sound files.

#pragma once

#include <string>

#include "core/CueError.h"
#include "core/Project.h"

namespace cuemix {

inline constexpr const char* kBundleFileExtension = ".cuemixz";

// `path` with its extension replaced by ".cuemixz".
[[nodiscard]] std::string WithBundleExtension(const std::string& path);

// Writes `project` and every registered sound file into a ZIP archive:
//   <Name>.cuemix          the project, sound paths relative to the root
//   <Name>/<file>          the sound files
// where <Name> is the archive's base name. Sound files sharing a base
// name are stored as "bell.wav", "bell_2.wav", ...
//
// Fails with kFileUnreadable when a sound file is missing and with
// kWriteFailed when the archive cannot be written or libzip was not
// enabled at build time.
[[nodiscard]] bool ExportProjectBundle(const Project& project,
                                       const std::string& bundle_path,
                                       CueError* error,
                                       std::string* error_message);

// Extracts a bundle below `destination_root` and loads it into
// `project`.
//
//  - The file must carry a ZIP signature and contain exactly one
//    root-level .cuemix; it is extracted to
//      <destination_root>/<Name>.cuemix
//  - Entries under the folder <Name>/ are extracted to
//      <destination_root>/<Name>/...
//    Hidden files and macOS metadata (__MACOSX/, .DS_Store) are
//    skipped. Existing files with identical content are left untouched;
//    differing ones are overwritten.
//  - The extracted project is loaded with LoadProjectFromFile.
//
// On success `extracted_project_path`, when provided, receives the path
// of the extracted .cuemix.
[[nodiscard]] bool ImportProjectBundle(const std::string& bundle_path,
                                       const std::string& destination_root,
                                       Project& project,
                                       std::string* extracted_project_path,
                                       CueError* error,
                                       std::string* error_message);

}  // namespace cuemix
