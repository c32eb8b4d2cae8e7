#include "memotrak/library/RecordingLibrary.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <format>
#include <iterator>
#include <system_error>

namespace memotrak::library {
namespace {

constexpr std::array<std::string_view, 12> kMonthNames = {
    "January", "February", "March",     "April",   "May",      "June",
    "July",    "August",   "September", "October", "November", "December",
};

std::optional<int> parseDigits(std::string_view text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    int value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static constexpr std::array<int, 12> kDays = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[static_cast<size_t>(month - 1)];
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool hasMatchingExtension(const std::filesystem::path& path, std::span<const std::string> extensions) {
    const std::string extension = toLower(path.extension().string());
    if (extension.empty()) {
        return false;
    }
    return std::any_of(extensions.begin(), extensions.end(),
                       [&](const std::string& candidate) { return toLower(candidate) == extension; });
}

}  // namespace

std::optional<RecordingTimestamp> parseRecordingTimestamp(std::string_view stem) {
    constexpr size_t kDateLength = 6;
    constexpr size_t kTimeOffset = 7;
    constexpr size_t kTimeLength = 4;

    if (stem.size() < kTimeOffset + kTimeLength) {
        return std::nullopt;
    }
    if (std::isdigit(static_cast<unsigned char>(stem[kDateLength])) != 0) {
        return std::nullopt;
    }

    const auto yy = parseDigits(stem.substr(0, 2));
    const auto mm = parseDigits(stem.substr(2, 2));
    const auto dd = parseDigits(stem.substr(4, 2));
    const auto hh = parseDigits(stem.substr(kTimeOffset, 2));
    const auto mi = parseDigits(stem.substr(kTimeOffset + 2, 2));
    if (!yy || !mm || !dd || !hh || !mi) {
        return std::nullopt;
    }

    RecordingTimestamp timestamp{
        .year = 2000 + *yy,
        .month = *mm,
        .day = *dd,
        .hour = *hh,
        .minute = *mi,
    };
    if (timestamp.month < 1 || timestamp.month > 12) {
        return std::nullopt;
    }
    if (timestamp.day < 1 || timestamp.day > daysInMonth(timestamp.year, timestamp.month)) {
        return std::nullopt;
    }
    if (timestamp.hour > 23 || timestamp.minute > 59) {
        return std::nullopt;
    }
    return timestamp;
}

std::expected<std::vector<Recording>, std::string> listRecordings(const std::filesystem::path& directory,
                                                                  std::span<const std::string> extensions) {
    std::error_code ec;
    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        return std::unexpected(std::format("Cannot read directory '{}': {}", directory.string(), ec.message()));
    }

    std::vector<Recording> recordings;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        std::error_code typeEc;
        if (!entry.is_regular_file(typeEc) || typeEc) {
            continue;
        }

        const auto& path = entry.path();
        if (!hasMatchingExtension(path, extensions)) {
            continue;
        }

        const auto timestamp = parseRecordingTimestamp(path.stem().string());
        if (!timestamp.has_value()) {
            continue;
        }

        recordings.push_back(Recording{
            .path = path,
            .filename = path.filename().string(),
            .timestamp = *timestamp,
        });
    }
    if (ec) {
        return std::unexpected(std::format("Error while listing '{}': {}", directory.string(), ec.message()));
    }

    std::sort(recordings.begin(), recordings.end(), [](const Recording& a, const Recording& b) {
        if (a.timestamp != b.timestamp) {
            return a.timestamp > b.timestamp;
        }
        return a.filename < b.filename;
    });
    return recordings;
}

std::vector<RecordingYear> groupRecordings(std::span<const Recording> recordings) {
    std::vector<RecordingYear> years;

    for (const auto& recording : recordings) {
        const auto& ts = recording.timestamp;

        auto yearIt = std::find_if(years.begin(), years.end(), [&](const RecordingYear& y) { return y.year == ts.year; });
        if (yearIt == years.end()) {
            years.push_back(RecordingYear{.year = ts.year, .months = {}});
            yearIt = std::prev(years.end());
        }

        auto& months = yearIt->months;
        auto monthIt =
            std::find_if(months.begin(), months.end(), [&](const RecordingMonth& m) { return m.month == ts.month; });
        if (monthIt == months.end()) {
            months.push_back(RecordingMonth{.month = ts.month, .days = {}});
            monthIt = std::prev(months.end());
        }

        auto& days = monthIt->days;
        auto dayIt = std::find_if(days.begin(), days.end(), [&](const RecordingDay& d) { return d.day == ts.day; });
        if (dayIt == days.end()) {
            days.push_back(RecordingDay{.day = ts.day, .recordings = {}});
            dayIt = std::prev(days.end());
        }

        dayIt->recordings.push_back(recording);
    }

    return years;
}

std::string_view monthName(int month) {
    if (month < 1 || month > 12) {
        return {};
    }
    return kMonthNames[static_cast<size_t>(month - 1)];
}

}  // namespace memotrak::library
