#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>

namespace memotrak::app {

/// Console application: wires settings, transcript store and playback engine to a ConsoleSession
/// reading commands from `in`.
class App {
public:
    explicit App(std::optional<std::filesystem::path> directory = std::nullopt);

    int run(std::istream& in, std::ostream& out);

private:
    std::optional<std::filesystem::path> directory_;
};

}  // namespace memotrak::app
