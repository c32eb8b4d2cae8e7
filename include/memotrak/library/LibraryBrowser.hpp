#pragma once

#include "memotrak/library/RecordingLibrary.hpp"
#include "memotrak/transcript/TranscriptStore.hpp"

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace memotrak::library {

/// One row of the browser view.
struct LibraryEntry {
    std::filesystem::path path;
    std::string label;   ///< File name.
    std::string detail;  ///< "HH:MM" for listings, a transcript preview for search hits.
    bool transcribed = false;
};

constexpr int kDefaultMinQueryLength = 3;
constexpr size_t kPreviewLength = 100;

/// Rows to show for `query`.
/// Queries shorter than `minQueryLength` are ignored and the whole listing is returned;
/// otherwise the transcript store's search hits are returned, newest first.
std::vector<LibraryEntry> filterLibrary(std::span<const Recording> listing, const transcript::TranscriptStore& store,
                                        std::string_view query, int minQueryLength = kDefaultMinQueryLength);

/// At most `maxChars` bytes of `text`, with "..." appended when it was cut.
/// The cut never falls inside a UTF-8 multi-byte sequence.
std::string transcriptPreview(std::string_view text, size_t maxChars = kPreviewLength);

}  // namespace memotrak::library
