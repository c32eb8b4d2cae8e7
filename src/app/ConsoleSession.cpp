#include "memotrak/app/ConsoleSession.hpp"

#include "memotrak/common/Logger.hpp"
#include "memotrak/common/TimeFormat.hpp"

#include <cctype>
#include <charconv>
#include <format>
#include <system_error>
#include <utility>

namespace memotrak::app {
namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

/// Splits off the first whitespace-delimited word; the remainder is trimmed.
std::pair<std::string_view, std::string_view> splitWord(std::string_view text) {
    text = trim(text);
    const size_t space = text.find_first_of(" \t");
    if (space == std::string_view::npos) {
        return {text, {}};
    }
    return {text.substr(0, space), trim(text.substr(space + 1))};
}

std::optional<size_t> parseIndex(std::string_view text) {
    size_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parseNumber(std::string_view text) {
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

ConsoleSession::ConsoleSession(audio::PlaybackEngine& engine, transcript::TranscriptStore& store,
                               AppSettings& settings, std::ostream& out,
                               std::optional<std::filesystem::path> storePath)
    : engine_(engine), store_(store), settings_(settings), out_(out), storePath_(std::move(storePath)) {}

bool ConsoleSession::openDirectory(const std::filesystem::path& directory) {
    auto listing = library::listRecordings(directory, settings_.audioExtensions);
    if (!listing.has_value()) {
        out_ << listing.error() << '\n';
        common::Logger::logError(listing.error());
        return false;
    }

    directory_ = directory;
    settings_.lastDirectory = directory;
    listing_ = std::move(*listing);
    rows_ = library::filterLibrary(listing_, store_, {}, 1);
    selection_.reset();
    common::Logger::log(std::format("Opened '{}' ({} recordings)", directory.string(), listing_.size()));
    printListing();
    return true;
}

bool ConsoleSession::execute(std::string_view line) {
    const auto [command, arguments] = splitWord(line);
    if (command.empty()) {
        return true;
    }

    if (command == "quit" || command == "exit") {
        return false;
    }
    if (command == "help") {
        printHelp(out_);
    } else if (command == "dir") {
        if (arguments.empty()) {
            out_ << "Usage: dir <directory>\n";
        } else {
            openDirectory(std::filesystem::path(arguments));
        }
    } else if (command == "list") {
        refresh();
        printListing();
    } else if (command == "search") {
        search(arguments);
    } else if (command == "select") {
        if (!resolveTarget(arguments).has_value()) {
            out_ << "No such row\n";
        }
    } else if (command == "load") {
        load(arguments);
    } else if (command == "play") {
        play();
    } else if (command == "pause") {
        engine_.pause();
        out_ << "Paused\n";
    } else if (command == "toggle") {
        toggle();
    } else if (command == "stop") {
        engine_.stop();
        out_ << "Stopped\n";
    } else if (command == "seek") {
        seek(arguments);
    } else if (command == "vol") {
        volume(arguments);
    } else if (command == "pos") {
        printPosition();
    } else if (command == "show") {
        show(arguments);
    } else if (command == "export") {
        exportTranscript(arguments);
    } else if (command == "transcript") {
        attachTranscript(arguments);
    } else {
        out_ << std::format("Unknown command '{}' (type 'help')\n", command);
    }
    return true;
}

void ConsoleSession::printHelp(std::ostream& out) {
    out << "Commands:\n"
           "  dir <directory>             list recordings in a directory\n"
           "  list                        re-read the current directory\n"
           "  search <query>              search transcripts (short queries show everything)\n"
           "  select <n>                  select row n\n"
           "  load [n|path]               load a recording\n"
           "  play | pause | toggle | stop\n"
           "  seek <seconds>              jump to a position\n"
           "  vol <0-100>                 set the volume\n"
           "  pos                         show position / duration\n"
           "  show [n]                    print a transcript\n"
           "  export [n] [destination]    save a transcript as text\n"
           "  transcript <n> <text...>    attach a transcript to a recording\n"
           "  quit\n";
}

void ConsoleSession::refresh() {
    if (!directory_.has_value()) {
        return;
    }
    auto listing = library::listRecordings(*directory_, settings_.audioExtensions);
    if (!listing.has_value()) {
        out_ << listing.error() << '\n';
        common::Logger::logError(listing.error());
        return;
    }
    listing_ = std::move(*listing);
    rows_ = library::filterLibrary(listing_, store_, {}, 1);
    if (selection_.has_value() && *selection_ >= rows_.size()) {
        selection_.reset();
    }
}

void ConsoleSession::printListing() const {
    if (!directory_.has_value()) {
        out_ << "No directory selected (use 'dir <directory>')\n";
        return;
    }
    if (listing_.empty()) {
        out_ << std::format("No recordings in {}\n", directory_->string());
        return;
    }

    size_t row = 0;
    for (const auto& year : library::groupRecordings(listing_)) {
        out_ << year.year << '\n';
        for (const auto& month : year.months) {
            out_ << "  " << library::monthName(month.month) << '\n';
            for (const auto& day : month.days) {
                out_ << "    " << day.day << '\n';
                for (const auto& recording : day.recordings) {
                    const bool transcribed = row < rows_.size() && rows_[row].transcribed;
                    ++row;
                    out_ << std::format("      [{}] {}  {:02}:{:02}{}\n", row, recording.filename,
                                        recording.timestamp.hour, recording.timestamp.minute,
                                        transcribed ? "  *" : "");
                }
            }
        }
    }
}

void ConsoleSession::printRows() const {
    if (rows_.empty()) {
        out_ << "No matches\n";
        return;
    }
    for (size_t i = 0; i < rows_.size(); ++i) {
        out_ << std::format("[{}] {}  {}\n", i + 1, rows_[i].label, rows_[i].detail);
    }
}

void ConsoleSession::printPosition() const {
    const char* state = engine_.isPlaying() ? "playing" : (engine_.isLoaded() ? "stopped" : "idle");
    out_ << std::format("{} / {} ({})\n", common::formatClock(engine_.position()),
                        common::formatClock(engine_.duration()), state);
}

void ConsoleSession::load(std::string_view argument) {
    const auto target = resolveTarget(argument);
    if (!target.has_value()) {
        out_ << "Nothing selected\n";
        return;
    }
    loadPath(*target);
}

void ConsoleSession::play() {
    if (!engine_.isLoaded()) {
        const auto target = resolveTarget({});
        if (!target.has_value() || !loadPath(*target)) {
            return;
        }
    }
    engine_.play();
    out_ << "Playing\n";
}

void ConsoleSession::toggle() {
    if (!engine_.currentFile().has_value()) {
        const auto target = resolveTarget({});
        if (!target.has_value() || !loadPath(*target)) {
            return;
        }
    }

    if (engine_.isPlaying()) {
        engine_.pause();
        out_ << "Paused\n";
    } else {
        engine_.play();
        out_ << "Playing\n";
    }
}

void ConsoleSession::seek(std::string_view argument) {
    const auto seconds = parseNumber(argument);
    if (!seconds.has_value()) {
        out_ << "Usage: seek <seconds>\n";
        return;
    }
    engine_.seek(*seconds);
    printPosition();
}

void ConsoleSession::volume(std::string_view argument) {
    const auto percent = parseNumber(argument);
    if (!percent.has_value()) {
        out_ << "Usage: vol <0-100>\n";
        return;
    }
    engine_.setVolume(static_cast<float>(*percent / 100.0));
    settings_.volume = engine_.volume();
    out_ << std::format("Volume {}%\n", static_cast<int>(engine_.volume() * 100.0f + 0.5f));
}

void ConsoleSession::search(std::string_view query) {
    rows_ = library::filterLibrary(listing_, store_, query, settings_.minSearchLength);
    selection_.reset();
    printRows();
}

void ConsoleSession::show(std::string_view argument) {
    const auto target = resolveTarget(argument);
    if (!target.has_value()) {
        out_ << "Nothing selected\n";
        return;
    }
    const auto text = store_.get(*target);
    if (!text.has_value()) {
        out_ << "No transcription available for this file.\n";
        return;
    }
    out_ << *text << '\n';
}

void ConsoleSession::exportTranscript(std::string_view arguments) {
    const auto [targetArg, destinationArg] = splitWord(arguments);
    const auto target = resolveTarget(targetArg);
    if (!target.has_value()) {
        out_ << "Nothing selected\n";
        return;
    }

    std::optional<std::filesystem::path> destination;
    if (!destinationArg.empty()) {
        destination = std::filesystem::path(destinationArg);
    }

    auto written = transcript::exportTranscriptText(store_, *target, destination);
    if (!written.has_value()) {
        out_ << written.error() << '\n';
        return;
    }
    out_ << std::format("Transcription saved to {}\n", written->string());
}

void ConsoleSession::attachTranscript(std::string_view arguments) {
    const auto [targetArg, text] = splitWord(arguments);
    const auto target = resolveTarget(targetArg);
    if (!target.has_value() || text.empty()) {
        out_ << "Usage: transcript <n|path> <text...>\n";
        return;
    }

    store_.add(*target, std::string(text));
    persistStore();
    for (auto& row : rows_) {
        if (row.path == *target) {
            row.transcribed = true;
        }
    }
    out_ << "Transcription stored\n";
}

std::optional<std::filesystem::path> ConsoleSession::resolveTarget(std::string_view argument) {
    argument = trim(argument);
    if (argument.empty()) {
        if (selection_.has_value() && *selection_ < rows_.size()) {
            return rows_[*selection_].path;
        }
        return std::nullopt;
    }

    if (const auto index = parseIndex(argument); index.has_value()) {
        if (*index == 0 || *index > rows_.size()) {
            return std::nullopt;
        }
        selection_ = *index - 1;
        return rows_[*selection_].path;
    }

    std::filesystem::path path(argument);
    if (path.is_relative() && directory_.has_value()) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec) && std::filesystem::exists(*directory_ / path, ec)) {
            return *directory_ / path;
        }
    }
    return path;
}

bool ConsoleSession::loadPath(const std::filesystem::path& path) {
    auto loaded = engine_.loadFile(path);
    if (!loaded.has_value()) {
        out_ << std::format("Could not load audio file: {}\n", loaded.error());
        return false;
    }
    out_ << std::format("Loaded {} ({})\n", path.filename().string(), common::formatClock(engine_.duration()));
    return true;
}

void ConsoleSession::persistStore() const {
    if (!storePath_.has_value()) {
        return;
    }
    if (auto saved = store_.saveTo(*storePath_); !saved.has_value()) {
        common::Logger::logError(saved.error());
        out_ << saved.error() << '\n';
    }
}

}  // namespace memotrak::app
