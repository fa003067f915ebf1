#pragma once

#include "sortfeed/detail/retry_policy_result.hh"
#include "sortfeed/retry_options.hh"
#include "sortfeed/time.hh"

#include <cstddef>
#include <random>

namespace sortfeed::detail {

/// Computes the delays between attempts of an optimistic transaction. Each
/// conflict multiplies the backoff by `factor` up to `max_backoff`. With
/// jitter enabled, the actual delay is drawn uniformly from `[0, backoff]`.
class exponential_backoff_retry_policy {
public:
  explicit exponential_backoff_retry_policy(retry_options opts = {});

  /// Starts a new operation, resetting backoff, attempt count and deadline.
  void reset();

  /// Registers a failed attempt.
  /// @returns `try_again` if the caller may retry after waiting for `delay()`
  ///          and `abort` if the attempt or time budget is exhausted.
  retry_policy_result operator()();

  /// Blocks the calling thread for `delay()`.
  void wait() const;

  /// Returns the delay before the next attempt.
  timespan delay() const noexcept {
    return delay_;
  }

  /// Returns the number of failed attempts since the last `reset()`.
  size_t attempts() const noexcept {
    return attempts_;
  }

  const retry_options& options() const noexcept {
    return opts_;
  }

  /// Checks whether the random number generator for the jitter has been
  /// seeded. The policy seeds it on the first jittered delay.
  bool seeded() const noexcept {
    return seeded_;
  }

private:
  retry_options opts_;
  size_t attempts_ = 0;
  timespan backoff_;
  timespan delay_;
  timestamp deadline_;
  std::minstd_rand rng_;
  bool seeded_ = false;
};

} // namespace sortfeed::detail
