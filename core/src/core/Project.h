#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/CueError.h"
#include "core/Mixer.h"
#include "core/SoundRegistry.h"

namespace cuemix {

class PlaybackBackend;

// Root aggregate: master volume, registered sounds and the mixers that
// sequence them. This is the unit that gets saved and loaded.
//
// Cue-to-sound references are names, so every operation that could
// invalidate a reference goes through here: sound removal is refused
// while cues still use the sound, and renames are propagated to cues.
class Project {
 public:
  static constexpr float kDefaultMasterVolume = 1.0F;

  Project() = default;

  [[nodiscard]] float master_volume() const { return master_volume_; }

  // Clamped to [0,1].
  void set_master_volume(float volume);

  // Sounds -------------------------------------------------------------

  [[nodiscard]] const SoundRegistry& sounds() const { return sounds_; }

  [[nodiscard]] bool AddSound(const std::string& name,
                              const std::string& path,
                              PlaybackBackend& backend, CueError* error,
                              std::string* error_message);

  // Restores a sound without validating the file (project loading).
  [[nodiscard]] bool InsertSound(Sound sound, CueError* error);

  // Renames the sound and every cue that points at it.
  [[nodiscard]] bool RenameSound(const std::string& old_name,
                                 const std::string& new_name,
                                 CueError* error);

  // Fails with kInUse while any cue of any mixer references the sound.
  [[nodiscard]] bool RemoveSound(const std::string& name, CueError* error);

  // Changes the file behind a sound; cues are unaffected.
  [[nodiscard]] bool RelocateSound(const std::string& name,
                                   const std::string& path, CueError* error);

  [[nodiscard]] std::size_t CountSoundReferences(
      const std::string& name) const;

  // Default sound name for a file: its base name, suffixed with " (2)",
  // " (3)", ... while that name is taken.
  [[nodiscard]] std::string SuggestSoundName(const std::string& path) const;

  // Mixers -------------------------------------------------------------

  [[nodiscard]] const std::vector<Mixer>& mixers() const { return mixers_; }

  [[nodiscard]] Mixer* FindMixer(const std::string& name);
  [[nodiscard]] const Mixer* FindMixer(const std::string& name) const;

  [[nodiscard]] bool AddMixer(const std::string& name, CueError* error);
  [[nodiscard]] bool RemoveMixer(const std::string& name, CueError* error);
  [[nodiscard]] bool RenameMixer(const std::string& old_name,
                                 const std::string& new_name,
                                 CueError* error);

  // "Mixer", then "Mixer 2", "Mixer 3", ... whichever is free first.
  [[nodiscard]] std::string NextMixerName() const;

  // Cues ---------------------------------------------------------------

  // Appends a cue to `mixer_name`. A non-empty `sound_name` must name a
  // registered sound.
  [[nodiscard]] bool AddCue(const std::string& mixer_name,
                            const std::string& cue_name, CueAction action,
                            const std::string& sound_name, CueError* error);

  // Points cue `index` of `mixer_name` at `sound_name` (empty clears the
  // assignment).
  [[nodiscard]] bool AssignCueSound(const std::string& mixer_name,
                                    std::size_t index,
                                    const std::string& sound_name,
                                    CueError* error);

  // Runs the active cue of `mixer_name`.
  [[nodiscard]] bool ExecuteCue(const std::string& mixer_name,
                                PlaybackBackend& backend, CueError* error);

  void ResetAllCursors();

  [[nodiscard]] bool empty() const {
    return sounds_.empty() && mixers_.empty();
  }

 private:
  float master_volume_{kDefaultMasterVolume};
  SoundRegistry sounds_;
  std::vector<Mixer> mixers_;
};

}  // namespace cuemix
