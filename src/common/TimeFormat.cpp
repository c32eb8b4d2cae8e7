#include "memotrak/common/TimeFormat.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <format>

namespace memotrak::common {

std::string formatClock(double seconds) {
    if (!(seconds > 0.0) || !std::isfinite(seconds)) {
        return "00:00";
    }
    // Clamped so the integer cast stays in range.
    constexpr double kMaxSeconds = 1e15;
    const auto whole = static_cast<int64_t>(std::min(seconds, kMaxSeconds));
    return std::format("{:02}:{:02}", whole / 60, whole % 60);
}

}  // namespace memotrak::common
