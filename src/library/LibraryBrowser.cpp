#include "memotrak/library/LibraryBrowser.hpp"

#include <format>

namespace memotrak::library {

std::vector<LibraryEntry> filterLibrary(std::span<const Recording> listing, const transcript::TranscriptStore& store,
                                        std::string_view query, int minQueryLength) {
    std::vector<LibraryEntry> entries;

    if (static_cast<int>(query.size()) < minQueryLength) {
        entries.reserve(listing.size());
        for (const auto& recording : listing) {
            entries.push_back(LibraryEntry{
                .path = recording.path,
                .label = recording.filename,
                .detail = std::format("{:02}:{:02}", recording.timestamp.hour, recording.timestamp.minute),
                .transcribed = store.hasTranscript(recording.path),
            });
        }
        return entries;
    }

    for (auto& match : store.search(query)) {
        const std::filesystem::path path(match.path);
        entries.push_back(LibraryEntry{
            .path = path,
            .label = path.filename().string(),
            .detail = transcriptPreview(match.text),
            .transcribed = true,
        });
    }
    return entries;
}

std::string transcriptPreview(std::string_view text, size_t maxChars) {
    if (text.size() <= maxChars) {
        return std::string(text);
    }
    size_t cut = maxChars;
    // Back up over UTF-8 continuation bytes so a multi-byte character is never split.
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return std::string(text.substr(0, cut)) + "...";
}

}  // namespace memotrak::library
