#pragma once

#include "memotrak/app/AppSettings.hpp"
#include "memotrak/transcript/TranscriptStore.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace memotrak::app {

/// Copies `path` next to itself as `<name>.bad`, or `<name>.bad.N` when earlier copies exist.
/// Returns the copy's location.
std::expected<std::filesystem::path, std::string> preserveUnreadableFile(const std::filesystem::path& path);

struct SettingsFile {
    AppSettings settings;
    /// Where to write the settings back; empty when they must not be written.
    std::filesystem::path saveTo;
};

/// Loads settings from `path`, falling back to defaults.
/// A file that exists but is rejected is preserved first; if that fails the settings are never
/// written back, so the user's file is not replaced by defaults.
SettingsFile openSettingsFile(const std::filesystem::path& path);

/// Loads `store` from `path` and returns where to persist it.
/// Returns nullopt when the file was rejected and could not be preserved; the store then lives in
/// memory only.
std::optional<std::filesystem::path> openTranscriptStore(transcript::TranscriptStore& store,
                                                         const std::filesystem::path& path);

}  // namespace memotrak::app
