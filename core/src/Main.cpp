// cuemix-player entry point: opens a project and runs the operator
// console against the JUCE audio engine (or a printing backend with
// --dry-run).

#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include <argparse/argparse.hpp>

#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>

#include "AppPreferences.h"
#include "AudioEngine.h"
#include "CueShell.h"
#include "DryRunBackend.h"
#include "core/CueError.h"
#include "core/ProjectDocument.h"
#include "core/StringConversions.h"

namespace {

void rememberProject(AppPreferences& preferences, const std::string& path)
{
    preferences.setLastProject(path);
    if (!preferences.save()) {
        juce::Logger::writeToLog(
            "[cuemix-player] Could not write settings to " +
            preferences.settingsFile().getFullPathName());
    }
}

}  // namespace

int main(int argc, char** argv)
{
    argparse::ArgumentParser program("cuemix-player", "0.1.0");
    program.add_description(
        "cuemix-player: run a CueMix show from the console.");
    program.add_argument("project")
        .help("Project (.cuemix) or bundle (.cuemixz) to open. Defaults to "
              "the last opened project.")
        .default_value(std::string{});
    program.add_argument("-v", "--volume")
        .help("Override the master volume (0..1) at start.")
        .scan<'g', double>();
    program.add_argument("-l", "--list")
        .help("Print the project summary and exit.")
        .flag();
    program.add_argument("-n", "--dry-run")
        .help("Print playback requests instead of opening an audio device.")
        .flag();
    program.add_argument("--log-file")
        .help("Write log messages to this file instead of stderr.")
        .default_value(std::string{});

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    const juce::ScopedJuceInitialiser_GUI juceInitialiser;

    std::unique_ptr<juce::FileLogger> fileLogger;
    const auto logFile = program.get<std::string>("--log-file");
    if (!logFile.empty()) {
        fileLogger = std::make_unique<juce::FileLogger>(
            cuemix::ToJuceFile(logFile),
            "cuemix-player log");
        juce::Logger::setCurrentLogger(fileLogger.get());
    }

    AppPreferences preferences(AppPreferences::defaultSettingsFile());
    preferences.load();

    std::unique_ptr<cuemix::PlaybackBackend> backend;
    if (program.get<bool>("--dry-run")) {
        backend = std::make_unique<DryRunBackend>(std::cout);
    } else {
        auto engine = std::make_unique<AudioEngine>();
        if (engine->hasNoOutputChannels()) {
            std::cerr << "[cuemix-player] No audio output device available; "
                         "cues will run silently."
                      << std::endl;
        } else if (engine->hasInitialisationError()) {
            std::cerr << "[cuemix-player] Audio device failed to start; "
                         "cues will run silently."
                      << std::endl;
        } else {
            juce::Logger::writeToLog("[cuemix-player] Output: " +
                                     cuemix::ToJuceString(
                                         engine->deviceDescription()));
        }
        backend = std::move(engine);
    }

    cuemix::ProjectDocument document;

    std::string projectPath = program.get<std::string>("project");
    const bool explicitProject = !projectPath.empty();
    if (!explicitProject && !preferences.lastProject().empty() &&
        cuemix::ToJuceFile(preferences.lastProject()).existsAsFile()) {
        projectPath = preferences.lastProject();
    }

    if (!projectPath.empty()) {
        cuemix::CueError error = cuemix::CueError::kNone;
        std::string detail;
        if (!document.Open(projectPath, &error, &detail)) {
            std::cerr << "[cuemix-player] Cannot open " << projectPath << ": "
                      << cuemix::CueErrorName(error) << ": " << detail
                      << std::endl;
            if (explicitProject) {
                juce::Logger::setCurrentLogger(nullptr);
                return 1;
            }
        } else if (explicitProject) {
            rememberProject(preferences, document.path());
        }
    }

    if (program.is_used("--volume")) {
        const double volume = program.get<double>("--volume");
        if (!(volume >= 0.0 && volume <= 1.0)) {
            std::cerr << "[cuemix-player] --volume must be within 0..1"
                      << std::endl;
            juce::Logger::setCurrentLogger(nullptr);
            return 1;
        }
        document.project().set_master_volume(static_cast<float>(volume));
    }

    CueShell shell(document, *backend, std::cout);
    shell.onDocumentPathChanged = [&preferences](const std::string& path) {
        rememberProject(preferences, path);
    };

    if (program.get<bool>("--list")) {
        shell.printSummary();
        juce::Logger::setCurrentLogger(nullptr);
        return 0;
    }

    shell.syncBackend();
    std::cout << "cuemix-player: " << document.DisplayName()
              << ". Type 'help' for commands." << std::endl;
    shell.run(std::cin);

    backend->StopAll(0.0);
    backend.reset();
    juce::Logger::setCurrentLogger(nullptr);
    return 0;
}
