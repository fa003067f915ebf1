#define SUITE detail.shared_message_queue

#include "sortfeed/detail/shared_message_queue.hh"

#include "test.hh"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>

using namespace sortfeed;
using namespace std::literals;

namespace {

constexpr size_t num_items = 1'000;

bool readable(int fd) {
  pollfd pfd{fd, POLLIN, 0};
  return ::poll(&pfd, 1, 0) == 1 && (pfd.revents & POLLIN) != 0;
}

message make_msg(size_t i) {
  return message{"feed.publish:test", std::to_string(i)};
}

} // namespace

TEST(the flare is active as long as the queue holds items) {
  auto queue = detail::make_shared_message_queue();
  CHECK(!readable(queue->fd()));
  queue->produce(make_msg(1));
  queue->produce(make_msg(2));
  CHECK(readable(queue->fd()));
  CHECK_EQUAL(queue->buffer_size(), 2u);
  auto xs = queue->consume(1);
  REQUIRE_EQUAL(xs.size(), 1u);
  CHECK_EQUAL(xs.front(), make_msg(1));
  CHECK(readable(queue->fd()));
  xs = queue->consume_all();
  REQUIRE_EQUAL(xs.size(), 1u);
  CHECK_EQUAL(xs.front(), make_msg(2));
  CHECK(!readable(queue->fd()));
}

TEST(awaiting with a deadline times out on empty queues) {
  auto queue = detail::make_shared_message_queue();
  CHECK(!queue->await_non_empty(now() + 5ms));
  queue->produce(make_msg(1));
  CHECK(queue->await_non_empty(now() + 5ms));
}

TEST(closed queues drop their items and ignore new ones) {
  auto queue = detail::make_shared_message_queue();
  queue->produce(make_msg(1));
  queue->stop_consuming();
  CHECK(queue->closed());
  CHECK_EQUAL(queue->buffer_size(), 0u);
  queue->produce(make_msg(2));
  CHECK_EQUAL(queue->buffer_size(), 0u);
  CHECK(!readable(queue->fd()));
}

TEST(a consumer thread receives all items in order) {
  auto queue = detail::make_shared_message_queue();
  std::vector<message> received;
  std::thread consumer{[&] {
    while (received.size() < num_items) {
      queue->await_non_empty();
      for (auto& x : queue->consume_all())
        received.emplace_back(std::move(x));
    }
  }};
  for (size_t i = 0; i < num_items; ++i)
    queue->produce(make_msg(i));
  consumer.join();
  REQUIRE_EQUAL(received.size(), num_items);
  for (size_t i = 0; i < num_items; ++i)
    CHECK_EQUAL(received[i], make_msg(i));
}
