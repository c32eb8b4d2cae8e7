#pragma once

#include <filesystem>

namespace memotrak::common {

/// Returns the directory containing the running executable.
std::filesystem::path executableDir();

/// Per-user configuration directory.
/// On Linux: $XDG_CONFIG_HOME/memotrak or ~/.config/memotrak. On Windows: %APPDATA%\memotrak.
/// Returns an empty path when no user location is available.
std::filesystem::path userConfigDir();

/// Per-user state directory (transcripts, log).
/// On Linux: $XDG_STATE_HOME/memotrak or ~/.local/state/memotrak. On Windows: %APPDATA%\memotrak.
/// Falls back to the executable directory when no user location is available.
std::filesystem::path userStateDir();

/// <config>/settings.json, or an empty path when there is no config directory.
std::filesystem::path settingsPath();

std::filesystem::path transcriptStorePath();

std::filesystem::path logPath();

}  // namespace memotrak::common
