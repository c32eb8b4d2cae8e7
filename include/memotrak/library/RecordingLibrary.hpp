#pragma once

#include <compare>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace memotrak::library {

/// Minute-resolution start time encoded in a recording's file name.
struct RecordingTimestamp {
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;

    auto operator<=>(const RecordingTimestamp&) const = default;
};

struct Recording {
    std::filesystem::path path;
    std::string filename;
    RecordingTimestamp timestamp;
};

struct RecordingDay {
    int day = 0;
    std::vector<Recording> recordings;
};

struct RecordingMonth {
    int month = 0;
    std::vector<RecordingDay> days;
};

struct RecordingYear {
    int year = 0;
    std::vector<RecordingMonth> months;
};

/// Parses a `YYMMDD_HHMM` file stem (any single non-digit separator, trailing text ignored).
/// YY maps to 20YY. Returns nullopt for anything that is not a valid calendar date and time.
std::optional<RecordingTimestamp> parseRecordingTimestamp(std::string_view stem);

/// Lists regular files in `directory` (not recursive) whose extension matches one of
/// `extensions` case-insensitively and whose stem parses as a recording timestamp.
/// Sorted newest first; equal timestamps are ordered by file name.
std::expected<std::vector<Recording>, std::string> listRecordings(const std::filesystem::path& directory,
                                                                  std::span<const std::string> extensions);

/// Groups an already sorted listing into year -> month -> day nodes, preserving order.
std::vector<RecordingYear> groupRecordings(std::span<const Recording> recordings);

/// English month name for 1..12, empty for anything else.
std::string_view monthName(int month);

}  // namespace memotrak::library
