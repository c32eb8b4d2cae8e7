#include "memotrak/common/Paths.hpp"

#include <cstdlib>

#ifdef _WIN32
#include <Windows.h>
#else
#include <unistd.h>

#include <climits>
#endif

namespace memotrak::common {
namespace {

#ifdef _WIN32
std::filesystem::path getExecutablePath() {
    wchar_t buf[MAX_PATH];
    const DWORD len = GetModuleFileNameW(nullptr, buf, MAX_PATH);
    if (len == 0 || len >= MAX_PATH) {
        return {};
    }
    return std::filesystem::path(buf);
}
#else
std::filesystem::path getExecutablePath() {
    char buf[PATH_MAX];
    const ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    buf[len] = '\0';
    return std::filesystem::path(buf);
}
#endif

/// Returns `$<name>` as a path, or an empty path when the variable is unset or empty.
std::filesystem::path envPath(const char* name) {
    if (const char* value = std::getenv(name); value != nullptr && value[0] != '\0') {
        return std::filesystem::path(value);
    }
    return {};
}

/// Resolves `$<xdgVar>/memotrak`, falling back to `~/<homeFallback>/memotrak`.
std::filesystem::path xdgDir([[maybe_unused]] const char* xdgVar, [[maybe_unused]] const char* homeFallback) {
#ifdef _WIN32
    if (auto appData = envPath("APPDATA"); !appData.empty()) {
        return appData / "memotrak";
    }
    return {};
#else
    if (auto xdg = envPath(xdgVar); !xdg.empty()) {
        return xdg / "memotrak";
    }
    if (auto home = envPath("HOME"); !home.empty()) {
        return home / homeFallback / "memotrak";
    }
    return {};
#endif
}

}  // namespace

std::filesystem::path executableDir() {
    static const std::filesystem::path dir = getExecutablePath().parent_path();
    return dir;
}

std::filesystem::path userConfigDir() {
    return xdgDir("XDG_CONFIG_HOME", ".config");
}

std::filesystem::path userStateDir() {
    auto dir = xdgDir("XDG_STATE_HOME", ".local/state");
    if (dir.empty()) {
        return executableDir();
    }
    return dir;
}

std::filesystem::path settingsPath() {
    const auto configDir = userConfigDir();
    if (configDir.empty()) {
        return {};
    }
    return configDir / "settings.json";
}

std::filesystem::path transcriptStorePath() {
    return userStateDir() / "transcripts.json";
}

std::filesystem::path logPath() {
    return userStateDir() / "memotrak.log";
}

}  // namespace memotrak::common
