#include "memotrak/app/AppSettings.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <fstream>
#include <string_view>
#include <system_error>

using json = nlohmann::json;

namespace memotrak::app {
namespace {

constexpr std::string_view kSettingsFormatTag = "memotrak_settings";
constexpr int kSettingsFormatVersion = 1;

std::expected<json, std::string> loadJsonFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(std::format("Failed to open '{}'", path.string()));
    }

    json parsed;
    try {
        in >> parsed;
        return parsed;
    } catch (const std::exception& ex) {
        return std::unexpected(std::format("Failed to parse settings file '{}': {}", path.string(), ex.what()));
    }
}

}  // namespace

std::expected<AppSettings, std::string> loadSettings(const std::filesystem::path& path) {
    AppSettings settings;

    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec) || ec) {
        return settings;
    }

    auto root = loadJsonFile(path);
    if (!root.has_value()) {
        return std::unexpected(root.error());
    }
    if (!root->is_object()) {
        return std::unexpected("Settings file root must be an object");
    }

    const auto formatIt = root->find("format");
    if (formatIt == root->end() || !formatIt->is_string() || formatIt->get<std::string>() != kSettingsFormatTag) {
        return std::unexpected(std::format("Unsupported settings format '{}'",
                                           formatIt == root->end() ? std::string() : formatIt->dump()));
    }
    const auto versionIt = root->find("version");
    if (versionIt != root->end() && !versionIt->is_number_integer()) {
        return std::unexpected(std::format("Settings version must be an integer, got {}", versionIt->dump()));
    }
    const int64_t version = versionIt == root->end() ? 0 : versionIt->get<int64_t>();
    if (version > kSettingsFormatVersion) {
        return std::unexpected(
            std::format("Unsupported settings version {} (expected <= {})", version, kSettingsFormatVersion));
    }

    try {
        if (const auto it = root->find("lastDirectory"); it != root->end() && it->is_string()) {
            settings.lastDirectory = std::filesystem::path(it->get<std::string>());
        }
        if (const auto it = root->find("volume"); it != root->end() && it->is_number()) {
            const float volume = it->get<float>();
            settings.volume = std::isnan(volume) ? 0.0f : std::clamp(volume, 0.0f, 1.0f);
        }
        if (const auto it = root->find("minSearchLength"); it != root->end() && it->is_number_integer()) {
            settings.minSearchLength = std::max(1, it->get<int>());
        }
        if (const auto it = root->find("audioExtensions"); it != root->end()) {
            if (!it->is_array()) {
                return std::unexpected("Settings audioExtensions must be an array");
            }
            std::vector<std::string> extensions;
            for (const auto& value : *it) {
                if (!value.is_string()) {
                    return std::unexpected("Settings audioExtensions entries must be strings");
                }
                std::string extension = value.get<std::string>();
                if (!extension.empty() && extension.front() != '.') {
                    extension.insert(extension.begin(), '.');
                }
                extensions.push_back(std::move(extension));
            }
            settings.audioExtensions = std::move(extensions);
        }
        if (const auto it = root->find("deviceSampleRate"); it != root->end() && it->is_number_unsigned()) {
            const auto rate = it->get<uint64_t>();
            if (rate > 0 && rate <= 384000) {
                settings.deviceSampleRate = static_cast<uint32_t>(rate);
            }
        }
    } catch (const std::exception& ex) {
        return std::unexpected(std::format("Invalid settings file '{}': {}", path.string(), ex.what()));
    }

    return settings;
}

std::expected<void, std::string> saveSettings(const AppSettings& settings, const std::filesystem::path& path) {
    if (path.empty()) {
        return std::unexpected("No settings location available");
    }

    json root = {
        {"format", std::string(kSettingsFormatTag)},
        {"version", kSettingsFormatVersion},
        {"volume", settings.volume},
        {"minSearchLength", settings.minSearchLength},
        {"audioExtensions", settings.audioExtensions},
        {"deviceSampleRate", settings.deviceSampleRate},
    };
    if (settings.lastDirectory.has_value()) {
        root["lastDirectory"] = settings.lastDirectory->string();
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(
                std::format("Failed to create directory '{}': {}", path.parent_path().string(), ec.message()));
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(std::format("Failed to open '{}' for writing", path.string()));
    }
    out << root.dump(2) << '\n';
    if (!out) {
        return std::unexpected(std::format("Failed to write settings to '{}'", path.string()));
    }
    return {};
}

}  // namespace memotrak::app
