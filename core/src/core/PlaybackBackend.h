#pragma once

#include <string>
#include <vector>

namespace cuemix {

struct Sound;

// Audio-engine seam used by the sequencer. Implementations are expected
// to be fire-and-forget: Play/Stop return as soon as the request has been
// queued and never wait for playback to progress.
class PlaybackBackend {
 public:
  virtual ~PlaybackBackend() = default;

  // Decodes (or otherwise validates) the file at `path` so that later
  // Play calls can start immediately. Returns false and fills
  // `error_message` when the file cannot be used.
  [[nodiscard]] virtual bool Preload(const std::string& path,
                                     std::string* error_message) = 0;

  // Length of the decoded file in milliseconds, or 0 when unknown. Used
  // to evaluate relative (percent) fade times.
  [[nodiscard]] virtual double GetLengthMs(const std::string& path) const = 0;

  virtual void Play(const Sound& sound, double fade_ms) = 0;
  virtual void Stop(const Sound& sound, double fade_ms) = 0;
  virtual void StopAll(double fade_ms) = 0;

  // Global gain in [0,1] applied to everything the backend outputs.
  virtual void SetMasterVolume(float volume) = 0;

  // Forgets preloaded data for every path not in `keep_paths`. Sounds
  // still playing are kept until a later call.
  virtual void ReleaseUnused(const std::vector<std::string>& keep_paths) = 0;
};

}  // namespace cuemix
