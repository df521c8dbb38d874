#include "DryRunBackend.h"

#include <iterator>
#include <memory>
#include <unordered_set>

#include "core/SoundRegistry.h"
#include "core/StringConversions.h"

namespace {

std::string canonicalKey(const std::string& path)
{
    return cuemix::ToJuceFile(path)
        .getFullPathName()
        .toStdString();
}

}  // namespace

DryRunBackend::DryRunBackend(std::ostream& out) : out_(out)
{
    formatManager_.registerBasicFormats();
}

bool DryRunBackend::Preload(const std::string& path,
                            std::string* error_message)
{
    const std::string key = canonicalKey(path);
    if (lengths_.count(key) != 0U) {
        return true;
    }

    const juce::File file(cuemix::ToJuceString(key));
    if (!file.existsAsFile()) {
        if (error_message != nullptr) {
            *error_message = "File does not exist: " + key;
        }
        return false;
    }

    std::unique_ptr<juce::AudioFormatReader> reader(
        formatManager_.createReaderFor(file));
    if (reader == nullptr || reader->sampleRate <= 0.0) {
        if (error_message != nullptr) {
            *error_message = "Unsupported audio format: " + key;
        }
        return false;
    }

    lengths_[key] = 1000.0 * static_cast<double>(reader->lengthInSamples) /
                    reader->sampleRate;
    return true;
}

double DryRunBackend::GetLengthMs(const std::string& path) const
{
    const auto it = lengths_.find(canonicalKey(path));
    return it != lengths_.end() ? it->second : 0.0;
}

void DryRunBackend::Play(const cuemix::Sound& sound, const double fade_ms)
{
    out_ << "[dry-run] play '" << sound.name << "' fade " << fade_ms
         << " ms\n";
}

void DryRunBackend::Stop(const cuemix::Sound& sound, const double fade_ms)
{
    out_ << "[dry-run] stop '" << sound.name << "' fade " << fade_ms
         << " ms\n";
}

void DryRunBackend::StopAll(const double fade_ms)
{
    out_ << "[dry-run] stop all, fade " << fade_ms << " ms\n";
}

void DryRunBackend::SetMasterVolume(const float volume)
{
    out_ << "[dry-run] master volume " << volume << "\n";
}

void DryRunBackend::ReleaseUnused(const std::vector<std::string>& keep_paths)
{
    std::unordered_set<std::string> keep;
    for (const auto& path : keep_paths) {
        keep.insert(canonicalKey(path));
    }
    for (auto it = lengths_.begin(); it != lengths_.end();) {
        it = keep.count(it->first) == 0U ? lengths_.erase(it) : std::next(it);
    }
}
