#pragma once

#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

#include <juce_audio_formats/juce_audio_formats.h>

#include "core/PlaybackBackend.h"

// Playback backend for rehearsing a show without an audio device: files
// are validated and measured with the JUCE format readers, playback
// requests are printed to `out` instead of being rendered.
class DryRunBackend : public cuemix::PlaybackBackend {
public:
    explicit DryRunBackend(std::ostream& out);

    [[nodiscard]] bool Preload(const std::string& path,
                               std::string* error_message) override;
    [[nodiscard]] double GetLengthMs(const std::string& path) const override;
    void Play(const cuemix::Sound& sound, double fade_ms) override;
    void Stop(const cuemix::Sound& sound, double fade_ms) override;
    void StopAll(double fade_ms) override;
    void SetMasterVolume(float volume) override;
    void ReleaseUnused(const std::vector<std::string>& keep_paths) override;

private:
    std::ostream& out_;
    juce::AudioFormatManager formatManager_;

    // Canonical path -> length in milliseconds.
    std::unordered_map<std::string, double> lengths_;
};
