#include "AudioEngine.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>
#include <utility>

#include "core/SoundRegistry.h"
#include "core/StringConversions.h"

AudioEngine::AudioEngine()
{
    // Initialise with no inputs and stereo outputs.
    juce::String audioError =
        deviceManager_.initialiseWithDefaultDevices(/*numInputChannels*/ 0,
                                                    /*numOutputChannels*/ 2);
    if (audioError.isNotEmpty()) {
        juce::Logger::writeToLog("[cuemix-core] Failed to initialise audio: " +
                                 audioError);

        // JUCE reports a missing output device as "no channels"; keep
        // that case apart so the player can say so explicitly.
        initError_ = true;
        if (audioError.containsIgnoreCase("no channels")) {
            noOutputChannels_ = true;
        }
    } else {
        deviceManager_.addAudioCallback(this);
        juce::Logger::writeToLog("[cuemix-core] Audio engine initialised.");
    }

    // WAV/AIFF/FLAC/Ogg, depending on the JUCE configuration.
    formatManager_.registerBasicFormats();
}

AudioEngine::~AudioEngine()
{
    shutdown();
}

void AudioEngine::shutdown()
{
    if (isShutdown_) {
        return;
    }

    isShutdown_ = true;

    // No further callbacks once this returns; the device itself is
    // closed by the AudioDeviceManager destructor.
    deviceManager_.removeAudioCallback(this);
}

std::string AudioEngine::deviceDescription() const
{
    auto* device = deviceManager_.getCurrentAudioDevice();
    if (device == nullptr) {
        return {};
    }
    return (device->getName() + " @ " +
            juce::String(device->getCurrentSampleRate(), 0) + " Hz")
        .toStdString();
}

void AudioEngine::audioDeviceAboutToStart(juce::AudioIODevice* device)
{
    const double sr =
        (device != nullptr) ? device->getCurrentSampleRate() : 44100.0;
    const double rate = sr > 0.0 ? sr : 44100.0;
    sampleRate_.store(rate, std::memory_order_relaxed);

    const int blockSize =
        (device != nullptr) ? device->getCurrentBufferSizeSamples() : 512;
    mixBuffer_.setSize(2, std::max(blockSize, 1), false, false, true);

    masterGain_.reset(rate, kMasterGainRampSeconds);
    masterGain_.setCurrentAndTargetValue(
        masterGainTarget_.load(std::memory_order_relaxed));
}

void AudioEngine::audioDeviceStopped()
{
    const juce::SpinLock::ScopedLockType lock(voiceLock_);
    for (auto& voice : voices_) {
        voice.active = false;
        voice.buffer.reset();
    }
}

void AudioEngine::audioDeviceIOCallbackWithContext(
    const float* const* inputChannelData,
    const int numInputChannels,
    float* const* outputChannelData,
    const int numOutputChannels,
    const int numSamples,
    const juce::AudioIODeviceCallbackContext& context)
{
    juce::ignoreUnused(inputChannelData, numInputChannels, context);

    for (int ch = 0; ch < numOutputChannels; ++ch) {
        if (outputChannelData[ch] != nullptr) {
            juce::FloatVectorOperations::clear(outputChannelData[ch],
                                               numSamples);
        }
    }
    if (numOutputChannels <= 0 || numSamples <= 0) {
        return;
    }

    // The device may deliver a larger block than announced.
    if (mixBuffer_.getNumSamples() < numSamples) {
        mixBuffer_.setSize(2, numSamples, false, false, true);
    }
    mixBuffer_.clear(0, numSamples);
    float* left = mixBuffer_.getWritePointer(0);
    float* right = mixBuffer_.getWritePointer(1);

    const double deviceRate = sampleRate_.load(std::memory_order_relaxed);
    {
        const juce::SpinLock::ScopedLockType lock(voiceLock_);
        for (auto& voice : voices_) {
            if (voice.active) {
                renderVoice(voice, left, right, numSamples, deviceRate);
            }
        }
    }

    masterGain_.setTargetValue(
        masterGainTarget_.load(std::memory_order_relaxed));
    for (int i = 0; i < numSamples; ++i) {
        const float g = masterGain_.getNextValue();
        left[i] *= g;
        right[i] *= g;
    }

    if (numOutputChannels == 1) {
        if (outputChannelData[0] != nullptr) {
            for (int i = 0; i < numSamples; ++i) {
                outputChannelData[0][i] = 0.5F * (left[i] + right[i]);
            }
        }
        return;
    }

    if (outputChannelData[0] != nullptr) {
        juce::FloatVectorOperations::copy(outputChannelData[0], left,
                                          numSamples);
    }
    if (outputChannelData[1] != nullptr) {
        juce::FloatVectorOperations::copy(outputChannelData[1], right,
                                          numSamples);
    }
}

void AudioEngine::renderVoice(Voice& voice, float* left, float* right,
                              const int numSamples, const double deviceRate)
{
    const DecodedSound* data = voice.buffer.get();
    if (data == nullptr || data->numFrames <= 0) {
        voice.active = false;
        return;
    }

    // Linear interpolation between neighbouring source frames.
    const double step = data->sourceSampleRate / deviceRate;
    const float* frames = data->interleaved.data();
    const int lastFrame = data->numFrames - 1;

    for (int i = 0; i < numSamples; ++i) {
        const int index = static_cast<int>(voice.position);
        if (index >= data->numFrames) {
            voice.active = false;
            break;
        }
        const int next = std::min(index + 1, lastFrame);
        const float frac =
            static_cast<float>(voice.position - static_cast<double>(index));

        const std::size_t a = static_cast<std::size_t>(index) * 2U;
        const std::size_t b = static_cast<std::size_t>(next) * 2U;
        const float l = frames[a] + (frames[b] - frames[a]) * frac;
        const float r =
            frames[a + 1] + (frames[b + 1] - frames[a + 1]) * frac;

        left[i] += l * voice.gain;
        right[i] += r * voice.gain;

        if (voice.gainStep != 0.0F) {
            voice.gain += voice.gainStep;
            const bool reached = voice.gainStep > 0.0F
                                     ? voice.gain >= voice.targetGain
                                     : voice.gain <= voice.targetGain;
            if (reached) {
                voice.gain = voice.targetGain;
                voice.gainStep = 0.0F;
            }
        }
        if (voice.releasing && voice.gain <= 0.0F) {
            voice.active = false;
            break;
        }

        voice.position += step;
    }

    if (!voice.active) {
        voice.buffer.reset();
        voice.releasing = false;
    }
}

std::string AudioEngine::canonicalKey(const std::string& path)
{
    // Normalise so that repeated requests for the same physical file
    // resolve to a single decoded buffer and a single voice.
    return cuemix::ToJuceFile(path)
        .getFullPathName()
        .toStdString();
}

std::shared_ptr<const AudioEngine::DecodedSound> AudioEngine::decode(
    const std::string& path, std::string* outError)
{
    const std::string key = canonicalKey(path);
    const auto cacheIt = cache_.find(key);
    if (cacheIt != cache_.end()) {
        return cacheIt->second;
    }

    const juce::File file(cuemix::ToJuceString(key));
    if (!file.existsAsFile()) {
        if (outError != nullptr) {
            *outError = "File does not exist: " + key;
        }
        return nullptr;
    }

    std::unique_ptr<juce::AudioFormatReader> reader(
        formatManager_.createReaderFor(file));
    if (reader == nullptr) {
        if (outError != nullptr) {
            *outError = "Unsupported audio format: " + key;
        }
        return nullptr;
    }

    const juce::int64 numSamples64 = reader->lengthInSamples;
    if (numSamples64 <= 0) {
        if (outError != nullptr) {
            *outError = "Empty audio file: " + key;
        }
        return nullptr;
    }
    if (reader->sampleRate <= 0.0) {
        if (outError != nullptr) {
            *outError = "Invalid sample rate: " + key;
        }
        return nullptr;
    }

    const int numFrames = static_cast<int>(std::min<juce::int64>(
        numSamples64, std::numeric_limits<int>::max()));
    const int channels = static_cast<int>(reader->numChannels);

    juce::AudioBuffer<float> tempBuffer(std::max(2, channels), numFrames);
    tempBuffer.clear();
    if (!reader->read(&tempBuffer, 0, numFrames, 0, true, true)) {
        if (outError != nullptr) {
            *outError = "Failed to read audio data: " + key;
        }
        return nullptr;
    }

    // Always stereo interleaved. Mono files are duplicated on both
    // channels; multi-channel files use the first two channels only.
    auto decoded = std::make_shared<DecodedSound>();
    decoded->interleaved.resize(static_cast<std::size_t>(numFrames) * 2U,
                                0.0F);
    decoded->numFrames = numFrames;
    decoded->sourceSampleRate = reader->sampleRate;

    const float* ch0 = tempBuffer.getReadPointer(0);
    const float* ch1 = channels > 1 ? tempBuffer.getReadPointer(1) : nullptr;
    for (int i = 0; i < numFrames; ++i) {
        const float l = ch0[i];
        const float r = ch1 != nullptr ? ch1[i] : l;
        const std::size_t base = static_cast<std::size_t>(i) * 2U;
        decoded->interleaved[base + 0] = l;
        decoded->interleaved[base + 1] = r;
    }

    juce::Logger::writeToLog(
        "[cuemix-core] Decoded " + file.getFileName() + " (" +
        juce::String(numFrames) + " frames, " +
        juce::String(reader->sampleRate, 0) + " Hz, " +
        juce::String(channels) + " ch)");

    cache_[key] = decoded;
    return decoded;
}

bool AudioEngine::Preload(const std::string& path, std::string* error_message)
{
    return decode(path, error_message) != nullptr;
}

double AudioEngine::GetLengthMs(const std::string& path) const
{
    const auto cacheIt = cache_.find(canonicalKey(path));
    if (cacheIt == cache_.end() || cacheIt->second == nullptr) {
        return 0.0;
    }
    const DecodedSound& data = *cacheIt->second;
    return 1000.0 * static_cast<double>(data.numFrames) /
           data.sourceSampleRate;
}

void AudioEngine::startRamp(Voice& voice, const float target,
                            const double fadeMs) const
{
    const double rate = sampleRate_.load(std::memory_order_relaxed);
    const double rampSamples = fadeMs * rate / 1000.0;
    voice.targetGain = target;
    if (rampSamples < 1.0) {
        voice.gain = target;
        voice.gainStep = 0.0F;
        return;
    }
    voice.gainStep =
        static_cast<float>((target - voice.gain) / rampSamples);
    if (voice.gainStep == 0.0F) {
        voice.gain = target;
    }
}

void AudioEngine::Play(const cuemix::Sound& sound, const double fade_ms)
{
    std::string error;
    auto buffer = decode(sound.path, &error);
    if (buffer == nullptr) {
        juce::Logger::writeToLog("[cuemix-core] Cannot play '" +
                                 cuemix::ToJuceString(sound.name) + "': " +
                                 cuemix::ToJuceString(error));
        return;
    }
    const std::string key = canonicalKey(sound.path);

    const juce::SpinLock::ScopedLockType lock(voiceLock_);

    // One voice per file: replaying restarts it. Otherwise take a free
    // voice, or steal the oldest one.
    Voice* target = nullptr;
    for (auto& voice : voices_) {
        if (voice.active && voice.key == key) {
            target = &voice;
            break;
        }
    }
    if (target == nullptr) {
        for (auto& voice : voices_) {
            if (!voice.active) {
                target = &voice;
                break;
            }
        }
    }
    if (target == nullptr) {
        target = &*std::min_element(
            voices_.begin(), voices_.end(),
            [](const Voice& a, const Voice& b) {
                return a.startOrder < b.startOrder;
            });
    }

    target->buffer = std::move(buffer);
    target->key = key;
    target->position = 0.0;
    target->gain = fade_ms > 0.0 ? 0.0F : 1.0F;
    target->releasing = false;
    target->active = true;
    target->startOrder = nextStartOrder_++;
    startRamp(*target, 1.0F, fade_ms);
}

void AudioEngine::Stop(const cuemix::Sound& sound, const double fade_ms)
{
    const std::string key = canonicalKey(sound.path);

    const juce::SpinLock::ScopedLockType lock(voiceLock_);
    for (auto& voice : voices_) {
        if (!voice.active || voice.key != key) {
            continue;
        }
        if (fade_ms <= 0.0) {
            voice.active = false;
            voice.buffer.reset();
        } else {
            voice.releasing = true;
            startRamp(voice, 0.0F, fade_ms);
        }
    }
}

void AudioEngine::StopAll(const double fade_ms)
{
    const juce::SpinLock::ScopedLockType lock(voiceLock_);
    for (auto& voice : voices_) {
        if (!voice.active) {
            continue;
        }
        if (fade_ms <= 0.0) {
            voice.active = false;
            voice.buffer.reset();
        } else {
            voice.releasing = true;
            startRamp(voice, 0.0F, fade_ms);
        }
    }
}

void AudioEngine::SetMasterVolume(const float volume)
{
    masterGainTarget_.store(juce::jlimit(0.0F, 1.0F, volume),
                            std::memory_order_relaxed);
}

void AudioEngine::ReleaseUnused(const std::vector<std::string>& keep_paths)
{
    std::unordered_set<std::string> keep;
    for (const auto& path : keep_paths) {
        keep.insert(canonicalKey(path));
    }
    {
        // A sound fading out after its removal keeps its buffer.
        const juce::SpinLock::ScopedLockType lock(voiceLock_);
        for (const auto& voice : voices_) {
            if (voice.active) {
                keep.insert(voice.key);
            }
        }
    }

    std::size_t released = 0;
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (keep.count(it->first) == 0U) {
            it = cache_.erase(it);
            ++released;
        } else {
            ++it;
        }
    }
    if (released > 0) {
        juce::Logger::writeToLog("[cuemix-core] Released " +
                                 juce::String(static_cast<int>(released)) +
                                 " cached sound(s)");
    }
}
