#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "core/Cue.h"
#include "core/CueError.h"

namespace cuemix {

class PlaybackBackend;
class SoundRegistry;

// How a cue should be rendered relative to the mixer cursor.
enum class CueDisplayState {
  kExecuted = 0,
  kActive,
  kPending,
};

// Named, ordered list of cues with an execution cursor.
//
// The cursor is an index in [0, N] where N is the number of cues:
//   0      nothing executed yet, cue 0 (if any) is active
//   i < N  cues [0, i) executed, cue i active
//   N      every cue executed; Execute fails until Back/Reset/JumpTo
//
// Cursor moves never undo audio: Back only moves the pointer.
class Mixer {
 public:
  Mixer() = default;
  explicit Mixer(std::string name);

  [[nodiscard]] const std::string& name() const { return name_; }
  void set_name(std::string name) { name_ = std::move(name); }

  [[nodiscard]] const std::vector<Cue>& cues() const { return cues_; }
  [[nodiscard]] std::size_t cue_count() const { return cues_.size(); }
  [[nodiscard]] const Cue* cue(std::size_t index) const;

  [[nodiscard]] std::size_t cursor() const { return cursor_; }
  [[nodiscard]] bool at_start() const { return cursor_ == 0U; }
  [[nodiscard]] bool finished() const { return cursor_ >= cues_.size(); }

  // Cue that the next Execute call will run, or nullptr when finished.
  [[nodiscard]] const Cue* active_cue() const;

  [[nodiscard]] CueDisplayState display_state(std::size_t index) const;

  // Editing ----------------------------------------------------------

  // Appends a cue. The cursor index does not move, so a mixer that was
  // finished now has the new cue active.
  Cue& AddCue(std::string name, CueAction action, std::string sound_name);
  Cue& AddCue(Cue cue);

  [[nodiscard]] bool DeleteCue(std::size_t index, CueError* error);
  [[nodiscard]] bool MoveCue(std::size_t from, std::size_t to,
                             CueError* error);

  [[nodiscard]] bool SetCueName(std::size_t index, std::string name,
                                CueError* error);
  [[nodiscard]] bool SetCueAction(std::size_t index, CueAction action,
                                  CueError* error);
  [[nodiscard]] bool SetCueSound(std::size_t index, std::string sound_name,
                                 CueError* error);
  [[nodiscard]] bool SetCueFade(std::size_t index, const FadeTime& fade,
                                CueError* error);

  // Number of cues that target `sound_name`.
  [[nodiscard]] std::size_t CountSoundReferences(
      const std::string& sound_name) const;

  // Rewrites every cue that targets `old_name` to target `new_name`.
  void RenameSoundReferences(const std::string& old_name,
                             const std::string& new_name);

  // Sequencing -------------------------------------------------------

  // Runs the active cue against `backend` and advances the cursor. A cue
  // without a sound advances silently. Fails with kNothingToExecute when
  // finished, or kNotFound (cursor unchanged) when the cue's sound is
  // missing from `sounds`.
  [[nodiscard]] bool Execute(const SoundRegistry& sounds,
                             PlaybackBackend& backend, CueError* error);

  [[nodiscard]] bool Back(CueError* error);

  void Reset() { cursor_ = 0U; }

  // Makes cue `index` the active cue without running it.
  [[nodiscard]] bool JumpTo(std::size_t index, CueError* error);

  // Restores a previously captured cursor, clamped to [0, N]. Used when
  // undo/redo swaps the cue list underneath a running show.
  void RestoreCursor(std::size_t cursor);

 private:
  [[nodiscard]] Cue* MutableCue(std::size_t index, CueError* error);

  std::string name_;
  std::vector<Cue> cues_;
  std::size_t cursor_{0U};
};

}  // namespace cuemix
