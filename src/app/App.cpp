#include "memotrak/app/App.hpp"

#include "memotrak/app/AppSettings.hpp"
#include "memotrak/app/ConsoleSession.hpp"
#include "memotrak/app/StateFiles.hpp"
#include "memotrak/audio/AudioDecoder.hpp"
#include "memotrak/audio/MiniaudioOutput.hpp"
#include "memotrak/audio/PlaybackEngine.hpp"
#include "memotrak/common/Logger.hpp"
#include "memotrak/common/Paths.hpp"
#include "memotrak/transcript/TranscriptStore.hpp"

#include <format>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <utility>

namespace memotrak::app {

App::App(std::optional<std::filesystem::path> directory) : directory_(std::move(directory)) {}

int App::run(std::istream& in, std::ostream& out) {
    memotrak::common::Logger::init(memotrak::common::logPath());
    memotrak::common::Logger::log("Starting memotrak...");

    auto settingsFile = openSettingsFile(memotrak::common::settingsPath());
    AppSettings& settings = settingsFile.settings;

    transcript::TranscriptStore store;
    const auto storeFile = openTranscriptStore(store, memotrak::common::transcriptStorePath());

    memotrak::common::Logger::log("Initializing audio engine...");
    audio::PlaybackEngine engine(std::make_unique<audio::MiniaudioDecoder>(), std::make_unique<audio::MiniaudioOutput>(),
                                 audio::PlaybackEngineOptions{.initialSampleRate = settings.deviceSampleRate});
    if (const auto& error = engine.deviceError(); error.has_value()) {
        out << std::format("Audio: N/A ({})\n", *error);
        memotrak::common::Logger::log("Audio engine failed to initialize (non-critical)");
    } else {
        memotrak::common::Logger::log("Audio engine initialized");
    }
    engine.setVolume(settings.volume);

    ConsoleSession session(engine, store, settings, out, storeFile);
    if (const auto directory = directory_ ? directory_ : settings.lastDirectory; directory.has_value()) {
        session.openDirectory(*directory);
    } else {
        out << "No directory selected (use 'dir <directory>', 'help' for commands)\n";
    }

    std::string line;
    out << "> " << std::flush;
    while (std::getline(in, line)) {
        if (!session.execute(line)) {
            break;
        }
        out << "> " << std::flush;
    }

    memotrak::common::Logger::log("Shutting down...");
    engine.stop();
    settings.volume = engine.volume();
    engine.shutdown();

    if (!settingsFile.saveTo.empty()) {
        if (auto saved = saveSettings(settings, settingsFile.saveTo); !saved.has_value()) {
            memotrak::common::Logger::logError(saved.error());
        }
    }
    if (storeFile.has_value()) {
        if (auto saved = store.saveTo(*storeFile); !saved.has_value()) {
            memotrak::common::Logger::logError(saved.error());
        }
    }

    memotrak::common::Logger::log("Shutdown complete");
    memotrak::common::Logger::shutdown();
    return 0;
}

}  // namespace memotrak::app
