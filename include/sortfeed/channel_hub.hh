#pragma once

#include "sortfeed/detail/shared_message_queue.hh"
#include "sortfeed/event_sink.hh"
#include "sortfeed/fwd.hh"
#include "sortfeed/subscriber.hh"

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sortfeed {

/// An in-process notification transport. Encodes each emitted event and
/// delivers it to every live subscriber of the channel, in emission order.
/// Notifications are not stored: subscribers never see events that were
/// emitted before they subscribed.
class channel_hub : public event_sink {
public:
  channel_hub() = default;

  ~channel_hub() override;

  /// Creates a new subscriber for all of the given channels.
  subscriber subscribe(std::vector<std::string> channels);

  void emit(const std::string& channel, const feed_event& ev) override;

  /// Returns the number of live subscribers for `channel`.
  size_t subscribers(const std::string& channel);

private:
  using queue_list = std::vector<detail::shared_message_queue_ptr>;

  /// Drops queues of destroyed subscribers.
  static void prune(queue_list& queues);

  std::mutex mtx_;
  std::unordered_map<std::string, queue_list> queues_;
};

} // namespace sortfeed
