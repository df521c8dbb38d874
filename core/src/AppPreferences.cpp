#include "AppPreferences.h"

#include <memory>
#include <utility>

#include "core/StringConversions.h"

namespace {

constexpr const char* kSettingsTag = "CueMixSettings";

}  // namespace

juce::File AppPreferences::defaultSettingsFile()
{
    return juce::File::getSpecialLocation(
               juce::File::userApplicationDataDirectory)
        .getChildFile("CueMix")
        .getChildFile("settings.xml");
}

AppPreferences::AppPreferences(juce::File settingsFile)
    : settingsFile_(std::move(settingsFile))
{
}

void AppPreferences::load()
{
    if (!settingsFile_.existsAsFile()) {
        return;
    }

    juce::XmlDocument document(settingsFile_);
    const std::unique_ptr<juce::XmlElement> root =
        document.getDocumentElement();
    if (root == nullptr || !root->hasTagName(kSettingsTag)) {
        juce::Logger::writeToLog("[cuemix-player] Ignoring unreadable settings "
                                 "file " +
                                 settingsFile_.getFullPathName());
        return;
    }

    lastProject_ =
        cuemix::ToStdString(root->getStringAttribute("lastProject"));
}

bool AppPreferences::save() const
{
    const auto directory = settingsFile_.getParentDirectory();
    if (!directory.isDirectory() && !directory.createDirectory().wasOk()) {
        return false;
    }

    juce::XmlElement root(kSettingsTag);
    root.setAttribute("lastProject", cuemix::ToJuceString(lastProject_));
    return root.writeTo(settingsFile_);
}
