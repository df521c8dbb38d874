#pragma once

#include <string>
#include <utility>

#include <juce_core/juce_core.h>

// Per-user player settings kept in a small XML file:
//   <CueMixSettings lastProject="/path/show.cuemix"/>
class AppPreferences {
public:
    // ~/.config/CueMix/settings.xml (or the platform equivalent).
    static juce::File defaultSettingsFile();

    explicit AppPreferences(juce::File settingsFile);

    // Reads the file; a missing or unreadable file leaves the defaults.
    void load();

    // Writes the file, creating its directory. Returns false on I/O
    // failure.
    bool save() const;

    [[nodiscard]] const std::string& lastProject() const
    {
        return lastProject_;
    }
    void setLastProject(std::string path) { lastProject_ = std::move(path); }

    [[nodiscard]] const juce::File& settingsFile() const
    {
        return settingsFile_;
    }

private:
    juce::File settingsFile_;
    std::string lastProject_;
};
