#include "memotrak/transcript/TranscriptStore.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>
#include <fstream>
#include <system_error>
#include <utility>

using json = nlohmann::json;

namespace memotrak::transcript {
namespace {

constexpr std::string_view kStoreFormatTag = "memotrak_transcripts";
constexpr int kStoreFormatVersion = 1;

std::string keyFor(const std::filesystem::path& audioPath) {
    return audioPath.lexically_normal().string();
}

std::string toLower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

std::optional<int64_t> fileLastModified(const std::filesystem::path& path) {
    std::error_code ec;
    const auto writeTime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    const auto systemTime = std::chrono::file_clock::to_sys(writeTime);
    return std::chrono::duration_cast<std::chrono::seconds>(systemTime.time_since_epoch()).count();
}

json entryToJson(const TranscriptEntry& entry) {
    json value = {
        {"path", entry.path},
        {"text", entry.text},
        {"status", std::string(toString(entry.status))},
        {"sequence", entry.sequence},
    };
    if (entry.lastModified.has_value()) {
        value["lastModified"] = *entry.lastModified;
    }
    return value;
}

/// Text of a JSON scalar for error messages: strings unquoted, anything else as serialized.
std::string describe(const json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

std::expected<TranscriptEntry, std::string> entryFromJson(const json& value) {
    if (!value.is_object()) {
        return std::unexpected("Transcript entry must be an object");
    }
    const auto pathIt = value.find("path");
    if (pathIt == value.end() || !pathIt->is_string()) {
        return std::unexpected("Transcript entry is missing a string 'path'");
    }

    TranscriptEntry entry;
    entry.path = pathIt->get<std::string>();

    if (const auto it = value.find("text"); it != value.end()) {
        if (!it->is_string()) {
            return std::unexpected(std::format("Transcript text for '{}' must be a string", entry.path));
        }
        entry.text = it->get<std::string>();
    }

    std::string statusText = "pending";
    if (const auto it = value.find("status"); it != value.end()) {
        if (!it->is_string()) {
            return std::unexpected(std::format("Transcript status for '{}' must be a string", entry.path));
        }
        statusText = it->get<std::string>();
    }
    const auto status = parseTranscriptStatus(statusText);
    if (!status.has_value()) {
        return std::unexpected(std::format("Unknown transcript status '{}' for '{}'", statusText, entry.path));
    }
    entry.status = *status;

    if (const auto it = value.find("lastModified"); it != value.end() && it->is_number_integer()) {
        entry.lastModified = it->get<int64_t>();
    }
    if (const auto it = value.find("sequence"); it != value.end()) {
        if (!it->is_number_unsigned()) {
            return std::unexpected(std::format("Transcript sequence for '{}' must be a non-negative integer", entry.path));
        }
        entry.sequence = it->get<uint64_t>();
    }
    return entry;
}

}  // namespace

std::string_view toString(TranscriptStatus status) {
    return status == TranscriptStatus::Completed ? "completed" : "pending";
}

std::optional<TranscriptStatus> parseTranscriptStatus(std::string_view text) {
    if (text == "completed") {
        return TranscriptStatus::Completed;
    }
    if (text == "pending") {
        return TranscriptStatus::Pending;
    }
    return std::nullopt;
}

std::vector<std::string> tokenizeTranscript(std::string_view text) {
    std::vector<std::string> words;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) != 0) {
            ++i;
        }
        const size_t start = i;
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) == 0) {
            ++i;
        }
        if (i > start) {
            words.push_back(toLower(text.substr(start, i - start)));
        }
    }
    return words;
}

void TranscriptStore::add(const std::filesystem::path& audioPath, std::string text) {
    const std::string key = keyFor(audioPath);
    const auto lastModified = fileLastModified(audioPath);

    std::lock_guard<std::mutex> lock(mutex_);
    unindexLocked(key);

    TranscriptEntry entry{
        .path = key,
        .text = std::move(text),
        .status = TranscriptStatus::Completed,
        .lastModified = lastModified,
        .sequence = nextSequence_++,
    };
    indexLocked(entry);
    entries_[key] = std::move(entry);
}

void TranscriptStore::markPending(const std::filesystem::path& audioPath) {
    const std::string key = keyFor(audioPath);

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = entries_.try_emplace(key);
    if (inserted) {
        it->second.path = key;
        it->second.sequence = nextSequence_++;
    }
    it->second.status = TranscriptStatus::Pending;
}

bool TranscriptStore::remove(const std::filesystem::path& audioPath) {
    const std::string key = keyFor(audioPath);

    std::lock_guard<std::mutex> lock(mutex_);
    unindexLocked(key);
    return entries_.erase(key) > 0;
}

std::optional<std::string> TranscriptStore::get(const std::filesystem::path& audioPath) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(keyFor(audioPath));
    if (it == entries_.end() || it->second.status != TranscriptStatus::Completed) {
        return std::nullopt;
    }
    return it->second.text;
}

std::optional<TranscriptEntry> TranscriptStore::entry(const std::filesystem::path& audioPath) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(keyFor(audioPath));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TranscriptStore::hasTranscript(const std::filesystem::path& audioPath) const {
    return get(audioPath).has_value();
}

size_t TranscriptStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<TranscriptMatch> TranscriptStore::search(std::string_view query) const {
    const std::string needle = toLower(query);

    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> matchedKeys;
    for (const auto& [word, keys] : wordIndex_) {
        if (word.find(needle) != std::string::npos) {
            matchedKeys.insert(keys.begin(), keys.end());
        }
    }

    std::vector<const TranscriptEntry*> hits;
    hits.reserve(matchedKeys.size());
    for (const auto& key : matchedKeys) {
        const auto it = entries_.find(key);
        if (it != entries_.end() && it->second.status == TranscriptStatus::Completed) {
            hits.push_back(&it->second);
        }
    }
    std::sort(hits.begin(), hits.end(),
              [](const TranscriptEntry* a, const TranscriptEntry* b) { return a->sequence > b->sequence; });

    std::vector<TranscriptMatch> matches;
    matches.reserve(hits.size());
    for (const auto* hit : hits) {
        matches.push_back(TranscriptMatch{.path = hit->path, .text = hit->text});
    }
    return matches;
}

std::expected<void, std::string> TranscriptStore::saveTo(const std::filesystem::path& path) const {
    json entries = json::array();
    uint64_t nextSequence = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, entry] : entries_) {
            entries.push_back(entryToJson(entry));
        }
        nextSequence = nextSequence_;
    }

    const json root = {
        {"format", std::string(kStoreFormatTag)},
        {"version", kStoreFormatVersion},
        {"nextSequence", nextSequence},
        {"entries", std::move(entries)},
    };

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
        return std::unexpected(std::format("Failed to write transcripts to '{}'", path.string()));
    }
    return {};
}

std::expected<void, std::string> TranscriptStore::loadFrom(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        wordIndex_.clear();
        nextSequence_ = 1;
        return {};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(std::format("Failed to open '{}'", path.string()));
    }

    json root;
    try {
        in >> root;
    } catch (const std::exception& ex) {
        return std::unexpected(std::format("Failed to parse transcript store '{}': {}", path.string(), ex.what()));
    }

    if (!root.is_object()) {
        return std::unexpected("Transcript store root must be an object");
    }
    const auto formatIt = root.find("format");
    if (formatIt == root.end() || !formatIt->is_string() || formatIt->get<std::string>() != kStoreFormatTag) {
        return std::unexpected(std::format("Unsupported transcript store format '{}'",
                                           formatIt == root.end() ? std::string() : describe(*formatIt)));
    }
    const auto versionIt = root.find("version");
    if (versionIt == root.end() || !versionIt->is_number_integer() ||
        versionIt->get<int64_t>() != kStoreFormatVersion) {
        return std::unexpected(std::format("Unsupported transcript store version {} (expected {})",
                                           versionIt == root.end() ? std::string("<missing>") : describe(*versionIt),
                                           kStoreFormatVersion));
    }
    const auto entriesIt = root.find("entries");
    if (entriesIt == root.end() || !entriesIt->is_array()) {
        return std::unexpected("Transcript store entries payload must be an array");
    }
    uint64_t storedNextSequence = 1;
    if (const auto it = root.find("nextSequence"); it != root.end()) {
        if (!it->is_number_unsigned()) {
            return std::unexpected("Transcript store nextSequence must be a non-negative integer");
        }
        storedNextSequence = it->get<uint64_t>();
    }

    std::map<std::string, TranscriptEntry> loaded;
    uint64_t maxSequence = 0;
    for (const auto& value : *entriesIt) {
        auto entry = entryFromJson(value);
        if (!entry.has_value()) {
            return std::unexpected(entry.error());
        }
        maxSequence = std::max(maxSequence, entry->sequence);
        std::string key = entry->path;
        loaded[std::move(key)] = std::move(*entry);
    }

    const uint64_t nextSequence = std::max(storedNextSequence, maxSequence + 1);

    std::lock_guard<std::mutex> lock(mutex_);
    entries_ = std::move(loaded);
    wordIndex_.clear();
    for (const auto& [key, entry] : entries_) {
        if (entry.status == TranscriptStatus::Completed) {
            indexLocked(entry);
        }
    }
    nextSequence_ = nextSequence;
    return {};
}

void TranscriptStore::indexLocked(const TranscriptEntry& entry) {
    for (auto& word : tokenizeTranscript(entry.text)) {
        wordIndex_[std::move(word)].insert(entry.path);
    }
}

void TranscriptStore::unindexLocked(const std::string& key) {
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return;
    }
    for (const auto& word : tokenizeTranscript(it->second.text)) {
        const auto indexIt = wordIndex_.find(word);
        if (indexIt == wordIndex_.end()) {
            continue;
        }
        indexIt->second.erase(key);
        if (indexIt->second.empty()) {
            wordIndex_.erase(indexIt);
        }
    }
}

std::expected<std::filesystem::path, std::string> exportTranscriptText(
    const TranscriptStore& store, const std::filesystem::path& audioPath,
    std::optional<std::filesystem::path> destination) {
    const auto text = store.get(audioPath);
    if (!text.has_value()) {
        return std::unexpected(std::format("No transcription available for '{}'", audioPath.string()));
    }

    std::filesystem::path target = destination.value_or(std::filesystem::path(audioPath).replace_extension(".txt"));
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(std::format("Could not open '{}' for writing", target.string()));
    }
    out << *text;
    if (!out) {
        return std::unexpected(std::format("Could not save transcription to '{}'", target.string()));
    }
    return target;
}

}  // namespace memotrak::transcript
