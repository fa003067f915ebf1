#pragma once

#include "sortfeed/time.hh"

#include <chrono>
#include <cstddef>
#include <string>

namespace sortfeed {

/// Configures how often and how fast a feed retries an optimistic transaction
/// after a write conflict.
struct retry_options {
  /// Delay before the first retry.
  timespan initial_backoff = std::chrono::microseconds{50};

  /// Upper bound for the delay between two attempts.
  timespan max_backoff = std::chrono::milliseconds{10};

  /// Growth factor of the delay after each conflict.
  double factor = 2.0;

  /// Picks a uniformly distributed delay in `[0, backoff]` if set.
  bool jitter = true;

  /// Maximum number of attempts per operation. 0 means unbounded.
  size_t max_attempts = 0;

  /// Maximum time a single operation may spend retrying.
  timespan timeout = infinite;
};

/// @relates retry_options
std::string to_string(const retry_options& x);

} // namespace sortfeed
