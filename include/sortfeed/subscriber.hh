#pragma once

#include "sortfeed/detail/shared_message_queue.hh"
#include "sortfeed/fwd.hh"
#include "sortfeed/message.hh"
#include "sortfeed/time.hh"

#include <optional>
#include <string>
#include <vector>

namespace sortfeed {

/// Provides blocking access to the notifications of a `channel_hub`. A
/// subscriber only receives notifications emitted after its creation.
class subscriber {
public:
  // --- friend declarations ---------------------------------------------------

  friend class channel_hub;

  // --- nested types ----------------------------------------------------------

  using queue_type = detail::shared_message_queue;

  using queue_ptr = detail::shared_message_queue_ptr;

  // --- constructors and destructors ------------------------------------------

  subscriber(subscriber&&) = default;

  subscriber& operator=(subscriber&&) = default;

  subscriber(const subscriber&) = delete;

  subscriber& operator=(const subscriber&) = delete;

  ~subscriber();

  // --- access to values ------------------------------------------------------

  /// Pulls a single value out of the stream. Blocks the current thread until
  /// at least one value becomes available.
  message get();

  /// Pulls a single value out of the stream. Blocks the current thread until
  /// at least one value becomes available or a timeout occurred.
  std::optional<message> get(timespan relative_timeout);

  /// Pulls a single value out of the stream. Blocks the current thread until
  /// at least one value becomes available or the deadline passes.
  std::optional<message> get(timestamp deadline);

  /// Returns all currently available values without blocking.
  std::vector<message> poll();

  // --- accessors -------------------------------------------------------------

  /// Returns the amount of values than can be extracted immediately without
  /// blocking.
  size_t available() const noexcept;

  /// Returns a file handle for integrating this subscriber into a `select` or
  /// `poll` loop.
  int fd() const noexcept;

  /// Returns the channels this subscriber listens to.
  const std::vector<std::string>& channels() const noexcept {
    return channels_;
  }

private:
  subscriber(queue_ptr queue, std::vector<std::string> channels);

  queue_ptr queue_;
  std::vector<std::string> channels_;
};

} // namespace sortfeed
