#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/CueError.h"

namespace cuemix {

class PlaybackBackend;

// A sound file registered in a project. Cues refer to sounds by name.
struct Sound {
  std::string name;
  std::string path;

  [[nodiscard]] bool operator==(const Sound& other) const {
    return name == other.name && path == other.path;
  }

  [[nodiscard]] bool operator!=(const Sound& other) const {
    return !(*this == other);
  }
};

// Ordered set of sounds with unique, non-empty names. Insertion order is
// kept so that front-ends can list sounds the way the user added them.
//
// The registry does not know about cues; refusing to remove a sound that
// is still referenced is handled by Project::RemoveSound.
class SoundRegistry {
 public:
  SoundRegistry() = default;

  // Registers a new sound after asking `backend` to load the file. On a
  // decoder failure the registry is left unchanged, `error` is set to
  // kFileUnreadable and `error_message` receives the decoder's reason.
  [[nodiscard]] bool Add(const std::string& name, const std::string& path,
                         PlaybackBackend& backend, CueError* error,
                         std::string* error_message);

  // Inserts a sound without touching the playback backend. Used when a
  // saved project is restored; only the name invariants are checked.
  [[nodiscard]] bool Insert(Sound sound, CueError* error);

  [[nodiscard]] bool Rename(const std::string& old_name,
                            const std::string& new_name, CueError* error);

  [[nodiscard]] bool Remove(const std::string& name, CueError* error);

  // Points an existing sound at another file without reloading it.
  [[nodiscard]] bool SetPath(const std::string& name, std::string path,
                             CueError* error);

  [[nodiscard]] const Sound* Find(const std::string& name) const;
  [[nodiscard]] bool Contains(const std::string& name) const {
    return Find(name) != nullptr;
  }

  [[nodiscard]] const std::vector<Sound>& sounds() const { return sounds_; }
  [[nodiscard]] std::size_t size() const { return sounds_.size(); }
  [[nodiscard]] bool empty() const { return sounds_.empty(); }

  [[nodiscard]] std::vector<std::string> names() const;

  void Clear() { sounds_.clear(); }

 private:
  [[nodiscard]] Sound* FindMutable(const std::string& name);

  std::vector<Sound> sounds_;
};

}  // namespace cuemix
