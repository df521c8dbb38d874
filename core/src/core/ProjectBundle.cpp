#include "core/ProjectBundle.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <utility>
#include <vector>

#if defined(CUEMIX_HAVE_LIBZIP)
#include <zip.h>
#endif

#include <juce_core/juce_core.h>

#include "core/ProjectSerialization.h"
#include "core/StringConversions.h"

namespace cuemix {
namespace {

namespace fs = std::filesystem;

bool Fail(const CueError code, const std::string& message,
          CueError* const error, std::string* const error_message)
{
  SetCueError(error, code);
  if (error_message != nullptr) {
    *error_message = message;
  }
  juce::Logger::writeToLog("[cuemix-core] " + ToJuceString(message));
  return false;
}

std::string ToLower(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string WithExtension(const std::string& path, const char* extension)
{
  fs::path result(path);
  if (ToLower(result.extension().string()) == extension) {
    return path;
  }
  result.replace_extension(extension);
  return result.string();
}

#if defined(CUEMIX_HAVE_LIBZIP)

bool HasZipSignature(const fs::path& path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return false;
  }

  unsigned char header[2] = {0, 0};
  in.read(reinterpret_cast<char*>(header), 2);
  if (in.gcount() < 2) {
    return false;
  }
  return header[0] == 0x50U && header[1] == 0x4bU;  // 'P''K'
}

std::string LastPathComponent(const std::string& name)
{
  std::string trimmed = name;
  while (!trimmed.empty() && trimmed.back() == '/') {
    trimmed.pop_back();
  }
  const auto pos = trimmed.find_last_of('/');
  return (pos == std::string::npos) ? trimmed : trimmed.substr(pos + 1U);
}

bool IsSkippedEntry(const std::string& name)
{
  if (name == "__MACOSX" || name.rfind("__MACOSX/", 0U) == 0U ||
      name.find("/__MACOSX/") != std::string::npos) {
    return true;
  }
  // Hidden files, including .DS_Store and AppleDouble "._" entries.
  const std::string base = LastPathComponent(name);
  return !base.empty() && base[0] == '.';
}

bool FilesAreIdentical(const fs::path& existing,
                       const std::vector<unsigned char>& data)
{
  std::error_code ec;
  const auto size = fs::file_size(existing, ec);
  if (ec || size != data.size()) {
    return false;
  }

  std::ifstream in(existing, std::ios::binary);
  if (!in.is_open()) {
    return false;
  }
  std::vector<unsigned char> current(data.size());
  if (!current.empty()) {
    in.read(reinterpret_cast<char*>(current.data()),
            static_cast<std::streamsize>(current.size()));
    if (static_cast<std::size_t>(in.gcount()) != current.size()) {
      return false;
    }
  }
  return current == data;
}

bool ReadEntry(zip_t* archive, const zip_uint64_t index,
               std::vector<unsigned char>& out, std::string& out_error)
{
  zip_stat_t st;
  zip_stat_init(&st);
  if (zip_stat_index(archive, index, 0, &st) != 0) {
    out_error = "Failed to stat bundle entry";
    return false;
  }

  out.resize(static_cast<std::size_t>(st.size));
  if (out.empty()) {
    return true;
  }

  zip_file_t* file = zip_fopen_index(archive, index, 0);
  if (file == nullptr) {
    out_error = "Failed to open bundle entry";
    return false;
  }

  std::size_t offset = 0;
  while (offset < out.size()) {
    const zip_int64_t n =
        zip_fread(file, out.data() + offset,
                  static_cast<zip_uint64_t>(out.size() - offset));
    if (n < 0) {
      zip_fclose(file);
      out_error = "Failed to read bundle entry";
      return false;
    }
    if (n == 0) {
      break;
    }
    offset += static_cast<std::size_t>(n);
  }
  zip_fclose(file);

  if (offset != out.size()) {
    out_error = "Truncated bundle entry";
    return false;
  }
  return true;
}

bool WriteUnlessIdentical(const fs::path& dest,
                          const std::vector<unsigned char>& data,
                          std::string& out_error)
{
  std::error_code ec;
  const auto parent = dest.parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      out_error = "Failed to create directory: " + parent.string();
      return false;
    }
  }

  if (fs::is_regular_file(dest, ec) && FilesAreIdentical(dest, data)) {
    return true;
  }

  std::ofstream out(dest, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    out_error = "Failed to write file: " + dest.string();
    return false;
  }
  if (!data.empty()) {
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
  }
  if (!out.good()) {
    out_error = "Failed to flush file: " + dest.string();
    return false;
  }
  return true;
}

// Picks "<stem><ext>", then "<stem>_2<ext>", ... among `taken`.
std::string UniqueEntryName(const fs::path& source,
                            std::set<std::string>& taken)
{
  const std::string stem = source.stem().string();
  const std::string ext = source.extension().string();
  std::string candidate = stem + ext;
  for (int suffix = 2; taken.count(ToLower(candidate)) != 0U; ++suffix) {
    candidate = stem + "_" + std::to_string(suffix) + ext;
  }
  taken.insert(ToLower(candidate));
  return candidate;
}

#endif  // CUEMIX_HAVE_LIBZIP

}  // namespace

std::string WithBundleExtension(const std::string& path)
{
  return WithExtension(path, kBundleFileExtension);
}

bool ExportProjectBundle(const Project& project,
                         const std::string& bundle_path,
                         CueError* const error,
                         std::string* const error_message)
{
#if !defined(CUEMIX_HAVE_LIBZIP)
  (void)project;
  (void)bundle_path;
  return Fail(CueError::kWriteFailed,
              "Bundle support is not available (libzip not enabled at "
              "build time)",
              error, error_message);
#else
  const fs::path bundle(bundle_path);
  const std::string base_name = bundle.stem().string();
  if (base_name.empty()) {
    return Fail(CueError::kInvalidName, "Bundle path has no file name",
                error, error_message);
  }

  // Rewrite sound paths relative to the archive root before anything
  // touches the destination file.
  Project bundled = project;
  std::vector<std::pair<std::string, std::string>> files;  // source, entry
  std::set<std::string> taken;
  for (const auto& sound : project.sounds().sounds()) {
    const fs::path source(sound.path);
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
      return Fail(CueError::kFileUnreadable,
                  "Sound file for '" + sound.name +
                      "' not found: " + sound.path,
                  error, error_message);
    }
    const std::string entry =
        base_name + "/" + UniqueEntryName(source, taken);
    files.emplace_back(sound.path, entry);
    if (!bundled.RelocateSound(sound.name, entry, nullptr)) {
      return Fail(CueError::kNotFound, "Lost sound '" + sound.name + "'",
                  error, error_message);
    }
  }
  const std::string project_text = SerializeProject(bundled);

  std::error_code ec;
  if (bundle.has_parent_path()) {
    fs::create_directories(bundle.parent_path(), ec);
  }

  int zip_error = 0;
  zip_t* archive =
      zip_open(bundle.string().c_str(), ZIP_CREATE | ZIP_TRUNCATE,
               &zip_error);
  if (archive == nullptr) {
    return Fail(CueError::kWriteFailed,
                "Failed to create bundle: " + bundle.string(), error,
                error_message);
  }

  const auto abort_with = [&](const std::string& message) {
    zip_discard(archive);
    return Fail(CueError::kWriteFailed, message, error, error_message);
  };

  // The buffer must stay alive until zip_close.
  zip_source_t* project_source = zip_source_buffer(
      archive, project_text.data(), project_text.size(), 0);
  if (project_source == nullptr ||
      zip_file_add(archive, (base_name + kProjectFileExtension).c_str(),
                   project_source, ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8) <
          0) {
    if (project_source != nullptr) {
      zip_source_free(project_source);
    }
    return abort_with("Failed to add project to bundle");
  }

  if (!files.empty() &&
      zip_dir_add(archive, base_name.c_str(), ZIP_FL_ENC_UTF_8) < 0) {
    return abort_with("Failed to add sound folder to bundle");
  }

  for (const auto& [source_path, entry] : files) {
    zip_source_t* source =
        zip_source_file(archive, source_path.c_str(), 0, 0);
    if (source == nullptr ||
        zip_file_add(archive, entry.c_str(), source,
                     ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8) < 0) {
      if (source != nullptr) {
        zip_source_free(source);
      }
      return abort_with("Failed to add " + source_path + " to bundle");
    }
  }

  if (zip_close(archive) != 0) {
    const std::string detail = zip_strerror(archive);
    zip_discard(archive);
    return Fail(CueError::kWriteFailed,
                "Failed to write bundle " + bundle.string() + ": " + detail,
                error, error_message);
  }

  juce::Logger::writeToLog("[cuemix-core] Exported bundle " +
                           ToJuceString(bundle.string()) + " (" +
                           juce::String(static_cast<int>(files.size())) +
                           " sound files)");
  return true;
#endif  // CUEMIX_HAVE_LIBZIP
}

bool ImportProjectBundle(const std::string& bundle_path,
                         const std::string& destination_root,
                         Project& project,
                         std::string* const extracted_project_path,
                         CueError* const error,
                         std::string* const error_message)
{
#if !defined(CUEMIX_HAVE_LIBZIP)
  (void)bundle_path;
  (void)destination_root;
  (void)project;
  (void)extracted_project_path;
  return Fail(CueError::kFileUnreadable,
              "Bundle support is not available (libzip not enabled at "
              "build time)",
              error, error_message);
#else
  const fs::path bundle(bundle_path);
  std::error_code ec;
  if (!fs::is_regular_file(bundle, ec)) {
    return Fail(CueError::kNotFound,
                "Bundle not found: " + bundle.string(), error,
                error_message);
  }
  if (!HasZipSignature(bundle)) {
    return Fail(CueError::kFileUnreadable,
                "Bundle is not a valid ZIP archive: " + bundle.string(),
                error, error_message);
  }

  int zip_error = 0;
  zip_t* archive = zip_open(bundle.string().c_str(), ZIP_RDONLY, &zip_error);
  if (archive == nullptr) {
    return Fail(CueError::kFileUnreadable,
                "Failed to open bundle: " + bundle.string(), error,
                error_message);
  }

  const auto abort_with = [&](const CueError code,
                              const std::string& message) {
    zip_discard(archive);
    return Fail(code, message, error, error_message);
  };

  const zip_int64_t entry_count = zip_get_num_entries(archive, 0);
  std::string project_entry;
  zip_uint64_t project_index = 0;
  int root_projects = 0;
  for (zip_uint64_t i = 0; i < static_cast<zip_uint64_t>(entry_count); ++i) {
    const char* name = zip_get_name(archive, i, 0);
    if (name == nullptr) {
      continue;
    }
    const std::string entry{name};
    if (IsSkippedEntry(entry) || entry.find('/') != std::string::npos) {
      continue;
    }
    if (fs::path(ToLower(entry)).extension() == kProjectFileExtension) {
      ++root_projects;
      project_entry = entry;
      project_index = i;
    }
  }

  if (root_projects == 0) {
    return abort_with(CueError::kSchemaError,
                      "Bundle does not contain a root-level .cuemix file");
  }
  if (root_projects > 1) {
    return abort_with(CueError::kSchemaError,
                      "Bundle contains multiple root-level .cuemix files");
  }

  const fs::path root = destination_root.empty()
                            ? bundle.parent_path()
                            : fs::path(destination_root);
  const std::string base_name = fs::path(project_entry).stem().string();
  const std::string folder_prefix = base_name + "/";

  std::vector<unsigned char> data;
  std::string io_error;
  if (!ReadEntry(archive, project_index, data, io_error)) {
    return abort_with(CueError::kFileUnreadable, io_error);
  }
  const fs::path project_dest = root / project_entry;
  if (!WriteUnlessIdentical(project_dest, data, io_error)) {
    return abort_with(CueError::kWriteFailed, io_error);
  }

  for (zip_uint64_t i = 0; i < static_cast<zip_uint64_t>(entry_count); ++i) {
    const char* name = zip_get_name(archive, i, 0);
    if (name == nullptr) {
      continue;
    }
    const std::string entry{name};
    if (entry.rfind(folder_prefix, 0U) != 0U || entry.back() == '/' ||
        IsSkippedEntry(entry)) {
      continue;
    }
    // Refuse entries that would land outside the destination folder.
    const fs::path relative = fs::path(entry).lexically_normal();
    if (relative.is_absolute() || *relative.begin() == "..") {
      continue;
    }

    if (!ReadEntry(archive, i, data, io_error)) {
      return abort_with(CueError::kFileUnreadable, io_error);
    }
    if (!WriteUnlessIdentical(root / relative, data, io_error)) {
      return abort_with(CueError::kWriteFailed, io_error);
    }
  }

  zip_discard(archive);

  std::string load_error;
  if (!LoadProjectFromFile(project_dest.string(), project, error,
                           &load_error)) {
    if (error_message != nullptr) {
      *error_message = "Failed to load project from bundle: " + load_error;
    }
    return false;
  }

  if (extracted_project_path != nullptr) {
    *extracted_project_path = project_dest.string();
  }
  juce::Logger::writeToLog("[cuemix-core] Imported bundle " +
                           ToJuceString(bundle.string()) + " into " +
                           ToJuceString(root.string()));
  return true;
#endif  // CUEMIX_HAVE_LIBZIP
}

}  // namespace cuemix
