#pragma once

#include "memotrak/app/AppSettings.hpp"
#include "memotrak/audio/PlaybackEngine.hpp"
#include "memotrak/library/LibraryBrowser.hpp"
#include "memotrak/library/RecordingLibrary.hpp"
#include "memotrak/transcript/TranscriptStore.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace memotrak::app {

/// Line-oriented front end over the playback engine, recording listing and transcript store.
/// Rows are numbered from 1 in the order of the current view (full listing or search hits).
class ConsoleSession {
public:
    ConsoleSession(audio::PlaybackEngine& engine, transcript::TranscriptStore& store, AppSettings& settings,
                   std::ostream& out, std::optional<std::filesystem::path> storePath = std::nullopt);

    /// List `directory` and make it the current one. Returns false if it cannot be read.
    bool openDirectory(const std::filesystem::path& directory);

    /// Run one command line. Returns false once the user asked to quit.
    bool execute(std::string_view line);

    const std::vector<library::LibraryEntry>& rows() const { return rows_; }
    const std::optional<std::filesystem::path>& directory() const { return directory_; }
    std::optional<size_t> selection() const { return selection_; }

    static void printHelp(std::ostream& out);

private:
    void refresh();
    void printListing() const;
    void printRows() const;
    void printPosition() const;

    void load(std::string_view argument);
    void play();
    void toggle();
    void seek(std::string_view argument);
    void volume(std::string_view argument);
    void search(std::string_view query);
    void show(std::string_view argument);
    void exportTranscript(std::string_view arguments);
    void attachTranscript(std::string_view arguments);

    /// Row number (1-based) or a file path. Empty falls back to the selection.
    std::optional<std::filesystem::path> resolveTarget(std::string_view argument);
    bool loadPath(const std::filesystem::path& path);
    void persistStore() const;

    audio::PlaybackEngine& engine_;
    transcript::TranscriptStore& store_;
    AppSettings& settings_;
    std::ostream& out_;
    std::optional<std::filesystem::path> storePath_;

    std::optional<std::filesystem::path> directory_;
    std::vector<library::Recording> listing_;
    std::vector<library::LibraryEntry> rows_;
    std::optional<size_t> selection_;
};

}  // namespace memotrak::app
