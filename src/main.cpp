#include "memotrak/app/App.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string_view>
#include <utility>

namespace {

int runApp(std::optional<std::filesystem::path> directory) {
    try {
        memotrak::app::App app(std::move(directory));
        return app.run(std::cin, std::cout);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << '\n';
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv) {
    std::optional<std::filesystem::path> directory;
    if (argc > 1) {
        const std::string_view argument = argv[1];
        if (argument == "-h" || argument == "--help") {
            std::cout << "Usage: memotrak [directory]\n";
            return 0;
        }
        directory = std::filesystem::path(argument);
    }
    return runApp(std::move(directory));
}
