#include "sortfeed/detail/shared_message_queue.hh"

#include <algorithm>
#include <iterator>

#include <caf/make_counted.hpp>

namespace sortfeed::detail {

void shared_message_queue::produce(message x) {
  guard_type guard{mtx_};
  if (closed_)
    return;
  if (xs_.empty())
    fx_.fire();
  xs_.emplace_back(std::move(x));
}

std::vector<message> shared_message_queue::consume(size_t num) {
  std::vector<message> result;
  guard_type guard{mtx_};
  if (xs_.empty() || num == 0)
    return result;
  auto n = std::min(num, xs_.size());
  auto b = xs_.begin();
  auto e = b + static_cast<ptrdiff_t>(n);
  result.insert(result.end(), std::make_move_iterator(b),
                std::make_move_iterator(e));
  xs_.erase(b, e);
  if (xs_.empty())
    fx_.extinguish_one();
  return result;
}

std::vector<message> shared_message_queue::consume_all() {
  return consume(buffer_size());
}

void shared_message_queue::await_non_empty() {
  fx_.await_one();
}

bool shared_message_queue::await_non_empty(timestamp deadline) {
  return fx_.await_one(deadline);
}

void shared_message_queue::stop_consuming() {
  guard_type guard{mtx_};
  if (closed_)
    return;
  closed_ = true;
  if (!xs_.empty()) {
    xs_.clear();
    fx_.extinguish_one();
  }
}

bool shared_message_queue::closed() const {
  guard_type guard{mtx_};
  return closed_;
}

size_t shared_message_queue::buffer_size() const {
  guard_type guard{mtx_};
  return xs_.size();
}

shared_message_queue_ptr make_shared_message_queue() {
  return caf::make_counted<shared_message_queue>();
}

} // namespace sortfeed::detail
