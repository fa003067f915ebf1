#include "sortfeed/subscriber.hh"

#include "sortfeed/internal/logger.hh"

namespace sortfeed {

subscriber::subscriber(queue_ptr queue, std::vector<std::string> channels)
  : queue_(std::move(queue)), channels_(std::move(channels)) {
  // nop
}

subscriber::~subscriber() {
  if (queue_)
    queue_->stop_consuming();
}

message subscriber::get() {
  for (;;) {
    queue_->await_non_empty();
    auto xs = queue_->consume(1);
    if (xs.size() == 1) {
      internal::log::notify::debug("received", "received {}", xs.front());
      return std::move(xs.front());
    }
  }
}

std::optional<message> subscriber::get(timespan relative_timeout) {
  if (relative_timeout == infinite)
    return get();
  return get(now() + relative_timeout);
}

std::optional<message> subscriber::get(timestamp deadline) {
  for (;;) {
    if (!queue_->await_non_empty(deadline))
      return std::nullopt;
    auto xs = queue_->consume(1);
    if (xs.size() == 1) {
      internal::log::notify::debug("received", "received {}", xs.front());
      return std::move(xs.front());
    }
  }
}

std::vector<message> subscriber::poll() {
  return queue_->consume_all();
}

size_t subscriber::available() const noexcept {
  return queue_->buffer_size();
}

int subscriber::fd() const noexcept {
  return queue_->fd();
}

} // namespace sortfeed
