#pragma once

#include <string>

namespace memotrak::common {

/// Whole seconds as "MM:SS". Fractions are truncated, minutes are not wrapped at 60,
/// and negative or non-finite input reads as "00:00". Input is clamped to 1e15 seconds.
std::string formatClock(double seconds);

}  // namespace memotrak::common
