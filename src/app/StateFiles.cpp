#include "memotrak/app/StateFiles.hpp"

#include "memotrak/common/Logger.hpp"

#include <format>
#include <system_error>
#include <utility>

namespace memotrak::app {
namespace {

constexpr int kMaxPreservedCopies = 100;

std::filesystem::path preservedPathFor(const std::filesystem::path& path, int attempt) {
    if (attempt == 0) {
        return std::filesystem::path(path.string() + ".bad");
    }
    return std::filesystem::path(std::format("{}.bad.{}", path.string(), attempt));
}

}  // namespace

std::expected<std::filesystem::path, std::string> preserveUnreadableFile(const std::filesystem::path& path) {
    for (int attempt = 0; attempt < kMaxPreservedCopies; ++attempt) {
        const auto target = preservedPathFor(path, attempt);
        std::error_code ec;
        const bool taken = std::filesystem::exists(target, ec);
        if (ec) {
            return std::unexpected(std::format("Failed to check '{}': {}", target.string(), ec.message()));
        }
        if (taken) {
            continue;
        }

        std::filesystem::copy_file(path, target, std::filesystem::copy_options::none, ec);
        if (ec) {
            return std::unexpected(std::format("Backup failed for '{}': {}", target.filename().string(), ec.message()));
        }
        return target;
    }
    return std::unexpected(std::format("Too many preserved copies of '{}'", path.filename().string()));
}

SettingsFile openSettingsFile(const std::filesystem::path& path) {
    SettingsFile file{.settings = {}, .saveTo = path};

    auto loaded = loadSettings(path);
    if (loaded.has_value()) {
        file.settings = std::move(*loaded);
        return file;
    }

    common::Logger::logWarning(std::format("Using default settings: {}", loaded.error()));
    if (auto preserved = preserveUnreadableFile(path); preserved.has_value()) {
        common::Logger::log(std::format("Previous settings kept as '{}'", preserved->string()));
    } else {
        common::Logger::logError(std::format("{}; settings will not be saved", preserved.error()));
        file.saveTo.clear();
    }
    return file;
}

std::optional<std::filesystem::path> openTranscriptStore(transcript::TranscriptStore& store,
                                                         const std::filesystem::path& path) {
    auto loaded = store.loadFrom(path);
    if (loaded.has_value()) {
        common::Logger::log(std::format("Loaded {} transcripts", store.size()));
        return path;
    }

    common::Logger::logError(std::format("Transcripts unavailable: {}", loaded.error()));
    auto preserved = preserveUnreadableFile(path);
    if (!preserved.has_value()) {
        common::Logger::logError(std::format("{}; transcripts will not be saved", preserved.error()));
        return std::nullopt;
    }
    common::Logger::log(std::format("Previous transcripts kept as '{}'", preserved->string()));
    return path;
}

}  // namespace memotrak::app
