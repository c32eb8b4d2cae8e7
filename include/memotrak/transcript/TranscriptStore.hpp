#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace memotrak::transcript {

enum class TranscriptStatus {
    Pending,
    Completed,
};

struct TranscriptEntry {
    std::string path;
    std::string text;
    TranscriptStatus status = TranscriptStatus::Pending;
    /// Last write time of the audio file when the transcript was stored, seconds since the Unix epoch.
    std::optional<int64_t> lastModified;
    /// Monotonic insertion counter; higher is newer.
    uint64_t sequence = 0;
};

struct TranscriptMatch {
    std::string path;
    std::string text;
};

/// Transcripts keyed by audio file path, with an inverted word index for search.
///
/// Words are whitespace-separated and lower-cased. Only completed transcripts are visible to
/// get() and search(). Thread-safe.
class TranscriptStore {
public:
    TranscriptStore() = default;

    TranscriptStore(const TranscriptStore&) = delete;
    TranscriptStore& operator=(const TranscriptStore&) = delete;

    /// Store `text` as the completed transcript of `audioPath`, replacing any previous one.
    void add(const std::filesystem::path& audioPath, std::string text);

    /// Record that a transcription of `audioPath` is in progress.
    void markPending(const std::filesystem::path& audioPath);

    bool remove(const std::filesystem::path& audioPath);

    std::optional<std::string> get(const std::filesystem::path& audioPath) const;
    std::optional<TranscriptEntry> entry(const std::filesystem::path& audioPath) const;
    bool hasTranscript(const std::filesystem::path& audioPath) const;
    size_t size() const;

    /// Completed transcripts containing a word that has `query` as a case-insensitive substring.
    /// Each path appears once; newest first. An empty query matches every non-empty transcript.
    std::vector<TranscriptMatch> search(std::string_view query) const;

    /// Write a JSON snapshot, creating parent directories as needed.
    std::expected<void, std::string> saveTo(const std::filesystem::path& path) const;

    /// Replace the contents with a JSON snapshot. A missing file leaves the store empty.
    std::expected<void, std::string> loadFrom(const std::filesystem::path& path);

private:
    void indexLocked(const TranscriptEntry& entry);
    void unindexLocked(const std::string& key);

    mutable std::mutex mutex_;
    std::map<std::string, TranscriptEntry> entries_;
    std::unordered_map<std::string, std::set<std::string>> wordIndex_;
    uint64_t nextSequence_ = 1;
};

std::string_view toString(TranscriptStatus status);
std::optional<TranscriptStatus> parseTranscriptStatus(std::string_view text);

/// Lower-cased whitespace-separated words of `text`, in order.
std::vector<std::string> tokenizeTranscript(std::string_view text);

/// Write the completed transcript of `audioPath` to a UTF-8 text file.
/// `destination` defaults to `audioPath` with its extension replaced by `.txt`.
/// Returns the path written.
std::expected<std::filesystem::path, std::string> exportTranscriptText(
    const TranscriptStore& store, const std::filesystem::path& audioPath,
    std::optional<std::filesystem::path> destination = std::nullopt);

}  // namespace memotrak::transcript
