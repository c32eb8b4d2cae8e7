#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace memotrak::app {

struct AppSettings {
    std::optional<std::filesystem::path> lastDirectory;
    float volume = 1.0f;
    int minSearchLength = 3;
    std::vector<std::string> audioExtensions{".mp3", ".wav", ".flac"};
    uint32_t deviceSampleRate = 48000;
};

/// Reads settings from `path`. A missing file yields defaults; unknown keys are ignored.
/// Out-of-range values are clamped (volume to [0, 1], minSearchLength to >= 1).
std::expected<AppSettings, std::string> loadSettings(const std::filesystem::path& path);

/// Writes settings to `path`, creating parent directories as needed.
std::expected<void, std::string> saveSettings(const AppSettings& settings, const std::filesystem::path& path);

}  // namespace memotrak::app
