#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>

namespace sortfeed {

/// A fractional timestamp represented in IEEE754 double-precision floating
/// point.
using fractional_seconds = std::chrono::duration<double>;

/// The clock type.
using clock = std::chrono::system_clock;

/// A duration with nanosecond precision.
using timespan = std::chrono::duration<int64_t, std::nano>;

/// A point in time anchored at the UNIX epoch: January 1, 1970.
using timestamp = std::chrono::time_point<clock, timespan>;

/// Constant representing an infinite amount of time.
static constexpr auto infinite = timespan{std::numeric_limits<int64_t>::max()};

/// @relates timespan
void convert(timespan s, double& secs);

/// @relates timespan
void convert(timespan s, std::string& str);

/// @relates timestamp
void convert(timestamp t, std::string& str);

/// @returns the current point in time (always real/wall clock time).
timestamp now();

/// @relates timespan
inline std::string to_string(const timespan& s) {
  std::string x;
  convert(s, x);
  return x;
}

/// @relates timestamp
inline std::string to_string(const timestamp& t) {
  std::string x;
  convert(t, x);
  return x;
}

} // namespace sortfeed
