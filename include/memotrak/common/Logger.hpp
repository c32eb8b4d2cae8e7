#pragma once

#include <filesystem>
#include <string>

namespace memotrak::common {

/// Process-wide diagnostic log.
/// Lines are appended to the file passed to init(); errors are echoed to stderr as well.
/// Before init() (and after shutdown()) only errors are written, to stderr.
class Logger {
public:
    static void init(const std::filesystem::path& logPath);
    static void log(const std::string& message);
    static void logWarning(const std::string& message);
    static void logError(const std::string& message);
    static void shutdown();

private:
    Logger() = default;
};

}  // namespace memotrak::common
