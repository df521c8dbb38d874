#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_audio_devices/juce_audio_devices.h>
#include <juce_audio_formats/juce_audio_formats.h>

#include "core/PlaybackBackend.h"

// Audio engine for the cue player.
//
// Responsibilities:
//   - Own a JUCE AudioDeviceManager with the default stereo output.
//   - Decode sound files once into in-memory stereo buffers, cached by
//     canonical path.
//   - Mix a fixed pool of voices on the audio thread, with linear
//     resampling to the device rate, per-voice fade ramps and a smoothed
//     master gain.
//
// Control calls (Play/Stop/StopAll/SetMasterVolume) come from the
// message thread and only touch the voice table under voiceLock_.
class AudioEngine : public juce::AudioIODeviceCallback,
                    public cuemix::PlaybackBackend {
public:
    AudioEngine();
    ~AudioEngine() override;

    // Maximum number of sounds playing at the same time. Starting one
    // more steals the voice that was started first.
    static constexpr int kMaxVoices = 32;

    // Master volume changes are ramped over this time to avoid clicks.
    static constexpr double kMasterGainRampSeconds = 0.05;

    // juce::AudioIODeviceCallback
    void audioDeviceAboutToStart(juce::AudioIODevice* device) override;
    void audioDeviceStopped() override;
    void audioDeviceIOCallbackWithContext(
        const float* const* inputChannelData,
        int numInputChannels,
        float* const* outputChannelData,
        int numOutputChannels,
        int numSamples,
        const juce::AudioIODeviceCallbackContext& context) override;

    // cuemix::PlaybackBackend
    [[nodiscard]] bool Preload(const std::string& path,
                               std::string* error_message) override;
    [[nodiscard]] double GetLengthMs(const std::string& path) const override;
    void Play(const cuemix::Sound& sound, double fade_ms) override;
    void Stop(const cuemix::Sound& sound, double fade_ms) override;
    void StopAll(double fade_ms) override;
    void SetMasterVolume(float volume) override;
    void ReleaseUnused(const std::vector<std::string>& keep_paths) override;

    // The default device opened without output channels. Cues still run,
    // silently.
    [[nodiscard]] bool hasNoOutputChannels() const noexcept
    {
        return noOutputChannels_;
    }

    // Device setup reported an error, "no channels" included.
    [[nodiscard]] bool hasInitialisationError() const noexcept
    {
        return initError_;
    }

    // Description of the open output device, or an empty string.
    [[nodiscard]] std::string deviceDescription() const;

    // Detaches from the device manager; safe to call more than once.
    void shutdown();

private:
    struct DecodedSound {
        std::vector<float> interleaved;  // stereo frames
        int numFrames{0};
        double sourceSampleRate{44100.0};
    };

    struct Voice {
        std::shared_ptr<const DecodedSound> buffer;
        std::string key;
        double position{0.0};
        float gain{0.0F};
        float targetGain{1.0F};
        float gainStep{0.0F};
        bool active{false};
        bool releasing{false};
        std::uint64_t startOrder{0};
    };

    // Returns the cached decoded buffer for `path`, decoding it first
    // when needed. Message thread only.
    std::shared_ptr<const DecodedSound> decode(const std::string& path,
                                               std::string* outError);

    [[nodiscard]] static std::string canonicalKey(const std::string& path);

    // Sets a ramp from the voice's current gain towards `target` over
    // `fadeMs`. Caller holds voiceLock_.
    void startRamp(Voice& voice, float target, double fadeMs) const;

    void renderVoice(Voice& voice, float* left, float* right,
                     int numSamples, double deviceRate);

    juce::AudioDeviceManager deviceManager_;
    juce::AudioFormatManager formatManager_;

    std::unordered_map<std::string, std::shared_ptr<const DecodedSound>>
        cache_;

    juce::SpinLock voiceLock_;
    std::array<Voice, kMaxVoices> voices_{};
    std::uint64_t nextStartOrder_{1};

    std::atomic<double> sampleRate_{44100.0};
    std::atomic<float> masterGainTarget_{1.0F};

    // Audio thread only.
    juce::SmoothedValue<float> masterGain_{1.0F};
    juce::AudioBuffer<float> mixBuffer_;

    bool isShutdown_{false};
    bool noOutputChannels_{false};
    bool initError_{false};
};
