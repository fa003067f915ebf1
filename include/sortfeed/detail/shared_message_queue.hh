#pragma once

#include "sortfeed/detail/flare.hh"
#include "sortfeed/message.hh"
#include "sortfeed/time.hh"

#include <deque>
#include <mutex>
#include <vector>

#include <caf/intrusive_ptr.hpp>
#include <caf/ref_counted.hpp>

namespace sortfeed::detail {

/// A producer-consumer queue for transferring notifications from a hub to a
/// subscriber. Uses a `flare` to signal available items to the user.
///
/// The protocol on the flare is as follows:
/// - the flare starts inactive
/// - the flare is active as long as xs_ has at least one item
/// - produce() fires the flare when it adds items to xs_ and xs_ was empty
/// - consume() extinguishes the flare when it removes the last item from xs_
class shared_message_queue : public caf::ref_counted {
public:
  using guard_type = std::unique_lock<std::mutex>;

  /// Inserts `x` into the queue. Ignored after the consumer has closed the
  /// queue.
  void produce(message x);

  /// Pulls up to `num` items out of the queue without blocking.
  std::vector<message> consume(size_t num);

  /// Pulls all items out of the queue without blocking.
  std::vector<message> consume_all();

  /// Blocks the consumer until the queue becomes non-empty.
  void await_non_empty();

  /// Blocks the consumer until the queue becomes non-empty or the deadline
  /// passes.
  /// @returns `true` if the queue has data, `false` on timeout.
  bool await_non_empty(timestamp deadline);

  /// Called by the consumer to signal that no more items get consumed.
  void stop_consuming();

  /// Returns whether the consumer has stopped.
  bool closed() const;

  size_t buffer_size() const;

  int fd() const noexcept {
    return fx_.fd();
  }

private:
  mutable std::mutex mtx_;
  std::deque<message> xs_;
  flare fx_;
  bool closed_ = false;
};

using shared_message_queue_ptr = caf::intrusive_ptr<shared_message_queue>;

shared_message_queue_ptr make_shared_message_queue();

} // namespace sortfeed::detail
