#include "sortfeed/channel_hub.hh"

#include "sortfeed/feed_event.hh"
#include "sortfeed/internal/logger.hh"

#include <algorithm>

namespace sortfeed {

channel_hub::~channel_hub() {
  // nop
}

subscriber channel_hub::subscribe(std::vector<std::string> channels) {
  auto queue = detail::make_shared_message_queue();
  {
    std::lock_guard<std::mutex> guard{mtx_};
    for (const auto& channel : channels) {
      auto& queues = queues_[channel];
      prune(queues);
      queues.emplace_back(queue);
    }
  }
  internal::log::notify::debug("subscribe", "new subscriber for {} channels",
                               channels.size());
  return subscriber{std::move(queue), std::move(channels)};
}

void channel_hub::emit(const std::string& channel, const feed_event& ev) {
  auto payload = encode(ev);
  std::lock_guard<std::mutex> guard{mtx_};
  auto i = queues_.find(channel);
  if (i == queues_.end())
    return;
  prune(i->second);
  internal::log::notify::debug("emit", "emit {} on {} to {} subscribers", ev,
                               channel, i->second.size());
  for (auto& queue : i->second)
    queue->produce(message{channel, payload});
}

size_t channel_hub::subscribers(const std::string& channel) {
  std::lock_guard<std::mutex> guard{mtx_};
  auto i = queues_.find(channel);
  if (i == queues_.end())
    return 0;
  prune(i->second);
  return i->second.size();
}

void channel_hub::prune(queue_list& queues) {
  auto closed = [](const detail::shared_message_queue_ptr& queue) {
    return queue->closed();
  };
  queues.erase(std::remove_if(queues.begin(), queues.end(), closed),
               queues.end());
}

} // namespace sortfeed
