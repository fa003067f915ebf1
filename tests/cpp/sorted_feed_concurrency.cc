#define SUITE sorted_feed_concurrency

#include "sortfeed/sorted_feed.hh"

#include "test.hh"

#include "sortfeed/channel_hub.hh"
#include "sortfeed/detail/memory_backend.hh"
#include "sortfeed/detail/sqlite_backend.hh"
#include "sortfeed/detail/transaction.hh"

#include "sortfeed/detail/filesystem.hh"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace sortfeed;
using namespace std::literals;

using id_list = std::vector<item_id>;

namespace {

constexpr size_t num_threads = 4;

constexpr size_t num_items = 50;

// Rejects the first `n` conditional commits as if a concurrent writer had
// modified a watched key.
class conflicting_backend : public detail::memory_backend {
public:
  explicit conflicting_backend(size_t n) : remaining_(n) {
    // nop
  }

  expected<bool> commit(const detail::transaction& tx) override {
    if (!tx.watches().empty() && remaining_ > 0) {
      --remaining_;
      ++rejected_;
      return false;
    }
    return memory_backend::commit(tx);
  }

  size_t rejected() const noexcept {
    return rejected_;
  }

private:
  size_t remaining_;
  size_t rejected_ = 0;
};

// Blocks the first event after `arm()` until `release()`.
class gated_sink : public recording_sink {
public:
  void emit(const std::string& channel, const feed_event& ev) override {
    {
      std::unique_lock<std::mutex> guard{mx_};
      if (armed_) {
        armed_ = false;
        entered_ = true;
        cv_.notify_all();
        cv_.wait(guard, [this] { return released_; });
      }
    }
    recording_sink::emit(channel, ev);
  }

  void arm() {
    std::unique_lock<std::mutex> guard{mx_};
    armed_ = true;
  }

  void await_entered() {
    std::unique_lock<std::mutex> guard{mx_};
    cv_.wait(guard, [this] { return entered_; });
  }

  void release() {
    std::unique_lock<std::mutex> guard{mx_};
    released_ = true;
    cv_.notify_all();
  }

private:
  std::mutex mx_;
  std::condition_variable cv_;
  bool armed_ = false;
  bool entered_ = false;
  bool released_ = false;
};

// Returns a connection to the feed's store. Either the same shared instance
// on every call or a new connection per call.
using backend_factory = std::function<detail::backend_ptr()>;

backend_factory shared_memory_backend() {
  auto backend = std::make_shared<detail::memory_backend>();
  return [backend] { return backend; };
}

backend_factory sqlite_connections(const std::string& path) {
  return [path]() -> detail::backend_ptr {
    auto backend = std::make_shared<detail::sqlite_backend>(
      backend_options{{"path", path},
                      {"journal_mode", "WAL"},
                      {"synchronous", "OFF"}});
    if (backend->init_failed())
      return nullptr;
    return backend;
  };
}

retry_options fast_retry(size_t max_attempts = 0) {
  retry_options result;
  result.initial_backoff = 1us;
  result.max_backoff = 100us;
  result.max_attempts = max_attempts;
  return result;
}

// Checks that the order and the item map contain the same IDs, each exactly
// once.
void check_consistency(const sorted_feed& feed) {
  auto ids = unbox(feed.get_ids());
  auto items = unbox(feed.get_items());
  std::set<item_id> unique_ids{ids.begin(), ids.end()};
  CHECK_EQUAL(unique_ids.size(), ids.size());
  std::set<item_id> item_ids;
  for (auto& kvp : items)
    item_ids.emplace(kvp.first);
  CHECK_EQUAL(unique_ids, item_ids);
}

// Publishes `num_items` items per thread and returns the IDs per thread.
std::vector<id_list> publish_from_threads(std::vector<sorted_feed>& feeds) {
  std::vector<id_list> results(feeds.size());
  barrier sync{static_cast<ptrdiff_t>(feeds.size())};
  std::vector<std::thread> threads;
  for (size_t index = 0; index < feeds.size(); ++index) {
    threads.emplace_back([&, index] {
      sync.arrive_and_wait();
      for (size_t i = 0; i < num_items; ++i) {
        auto content = std::to_string(index) + ":" + std::to_string(i);
        if (auto id = feeds[index].publish(content))
          results[index].push_back(*id);
      }
    });
  }
  for (auto& thread : threads)
    thread.join();
  return results;
}

void check_unique_and_increasing(const std::vector<id_list>& results) {
  std::set<item_id> all;
  for (auto& ids : results) {
    CHECK_EQUAL(ids.size(), num_items);
    CHECK(std::is_sorted(ids.begin(), ids.end()));
    CHECK(std::adjacent_find(ids.begin(), ids.end()) == ids.end());
    all.insert(ids.begin(), ids.end());
  }
  CHECK_EQUAL(all.size(), num_threads * num_items);
}

// Races an edit against a retract of the same item `num_items` times. Each
// feed gets its own connection from `connect`.
void run_edit_retract_race(const backend_factory& connect) {
  auto sink = std::make_shared<recording_sink>();
  auto editor_backend = connect();
  auto remover_backend = connect();
  REQUIRE(editor_backend != nullptr);
  REQUIRE(remover_backend != nullptr);
  sorted_feed editor{editor_backend, "race", sink};
  sorted_feed remover{remover_backend, "race", sink};
  size_t edits = 0;
  for (size_t round = 0; round < num_items; ++round) {
    auto id = unbox(editor.publish("original"));
    barrier sync{2};
    expected<void> edit_res;
    expected<void> retract_res;
    std::thread t1{[&] {
      sync.arrive_and_wait();
      edit_res = editor.edit(id, "edited");
    }};
    std::thread t2{[&] {
      sync.arrive_and_wait();
      retract_res = remover.retract(id);
    }};
    t1.join();
    t2.join();
    CHECK(retract_res);
    if (edit_res) {
      ++edits;
    } else {
      CHECK_EQUAL(edit_res.error(), ec::no_such_item);
    }
    CHECK_EQUAL(editor.get_item(id).error(), ec::no_such_item);
    auto ids = unbox(editor.get_ids());
    CHECK(std::find(ids.begin(), ids.end(), id) == ids.end());
  }
  MESSAGE("each committed mutation emitted exactly one event");
  size_t publishes = 0;
  size_t retracts = 0;
  for (auto& entry : sink->events()) {
    if (entry.first == editor.keys().retract_channel)
      ++retracts;
    else
      ++publishes;
  }
  CHECK_EQUAL(retracts, num_items);
  CHECK_EQUAL(publishes, num_items + edits);
  CHECK_EQUAL(unbox(editor.publishes()), num_items + edits);
  check_consistency(editor);
}

// Lets `num_threads` feeds insert next to an anchor while another feed
// retracts it. Each feed gets its own connection from `connect`.
void run_relative_insert_race(const backend_factory& connect) {
  auto remover_backend = connect();
  REQUIRE(remover_backend != nullptr);
  sorted_feed remover{remover_backend, "race"};
  std::vector<sorted_feed> inserters;
  for (size_t i = 0; i < num_threads; ++i) {
    auto backend = connect();
    REQUIRE(backend != nullptr);
    inserters.emplace_back(std::move(backend), "race");
  }
  std::atomic<size_t> failures{0};
  for (size_t round = 0; round < 10; ++round) {
    auto anchor = unbox(remover.publish("anchor"));
    barrier sync{static_cast<ptrdiff_t>(num_threads + 1)};
    std::vector<std::thread> threads;
    for (size_t index = 0; index < num_threads; ++index) {
      threads.emplace_back([&, index] {
        sync.arrive_and_wait();
        for (size_t i = 0; i < 5; ++i) {
          auto res = inserters[index].publish_after(anchor, "x");
          if (!res && res.error() != ec::no_such_item)
            ++failures;
        }
      });
    }
    threads.emplace_back([&] {
      sync.arrive_and_wait();
      if (!remover.retract(anchor))
        ++failures;
    });
    for (auto& thread : threads)
      thread.join();
    check_consistency(remover);
  }
  CHECK_EQUAL(failures.load(), 0u);
}

// Lets two feeds edit the same item while the sink stalls the first commit's
// event. The events must still arrive in commit order.
void run_commit_order_check(const detail::backend_ptr& backend) {
  auto sink = std::make_shared<gated_sink>();
  sorted_feed first{backend, "order", sink};
  sorted_feed second{backend, "order", sink};
  auto id = unbox(first.publish("0"));
  sink->arm();
  expected<void> res1;
  expected<void> res2;
  std::thread t1{[&] { res1 = first.edit(id, "1"); }};
  sink->await_entered();
  std::thread t2{[&] { res2 = second.edit(id, "2"); }};
  // Gives the second edit the chance to commit ahead of the stalled event if
  // the backend admitted it.
  std::this_thread::sleep_for(20ms);
  sink->release();
  t1.join();
  t2.join();
  CHECK(res1);
  CHECK(res2);
  auto events = sink->events();
  REQUIRE_EQUAL(events.size(), 3u);
  CHECK_EQUAL(events[1].second.content, "1"s);
  CHECK_EQUAL(events[2].second.content, "2"s);
  CHECK_EQUAL(unbox(first.get_item(id)), events[2].second.content);
}

} // namespace

TEST(concurrent publishers receive unique and increasing IDs) {
  auto backend = std::make_shared<detail::memory_backend>();
  std::vector<sorted_feed> feeds;
  for (size_t i = 0; i < num_threads; ++i)
    feeds.emplace_back(backend, "race");
  auto results = publish_from_threads(feeds);
  check_unique_and_increasing(results);
  CHECK_EQUAL(unbox(feeds[0].get_ids()).size(), num_threads * num_items);
  CHECK_EQUAL(unbox(feeds[0].publishes()), num_threads * num_items);
  check_consistency(feeds[0]);
}

TEST(concurrent edit and retract never leave half removed items) {
  run_edit_retract_race(shared_memory_backend());
}

TEST(relative inserts racing with a retract of their anchor stay consistent) {
  run_relative_insert_race(shared_memory_backend());
}

TEST(sqlite edit and retract race over separate connections) {
  auto path = temp_db_path("edit-retract");
  run_edit_retract_race(sqlite_connections(path));
  detail::remove(path);
}

TEST(sqlite relative inserts race with a retract over separate connections) {
  auto path = temp_db_path("relative-insert");
  run_relative_insert_race(sqlite_connections(path));
  detail::remove(path);
}

TEST(events arrive in commit order even if the sink stalls) {
  run_commit_order_check(std::make_shared<detail::memory_backend>());
}

TEST(sqlite connections emit their events in commit order) {
  auto path = temp_db_path("commit-order");
  auto backend = sqlite_connections(path)();
  REQUIRE(backend != nullptr);
  run_commit_order_check(backend);
  backend.reset();
  detail::remove(path);
}

TEST(conflicting commits are retried until they succeed) {
  auto backend = std::make_shared<conflicting_backend>(3);
  auto hub = std::make_shared<channel_hub>();
  sorted_feed feed{backend, "retry", hub, fast_retry()};
  auto sub = hub->subscribe({feed.keys().publish_channel});
  auto a = unbox(feed.publish("a"));
  CHECK_EQUAL(backend->rejected(), 0u);
  REQUIRE(feed.edit(a, "b"));
  CHECK_EQUAL(backend->rejected(), 3u);
  CHECK_EQUAL(unbox(feed.get_item(a)), "b"s);
  CHECK_EQUAL(sub.poll().size(), 2u);
}

TEST(exhausting the retry limit aborts without side effects) {
  auto backend = std::make_shared<conflicting_backend>(100);
  auto hub = std::make_shared<channel_hub>();
  sorted_feed feed{backend, "retry", hub, fast_retry(3)};
  auto sub = hub->subscribe({feed.keys().publish_channel,
                             feed.keys().retract_channel});
  auto a = unbox(feed.publish("a"));
  sub.poll();
  auto res = feed.edit(a, "b");
  REQUIRE(!res);
  CHECK_EQUAL(res.error(), ec::retry_limit_exceeded);
  CHECK_EQUAL(backend->rejected(), 3u);
  CHECK_EQUAL(unbox(feed.get_item(a)), "a"s);
  CHECK_EQUAL(feed.retract(a).error(), ec::retry_limit_exceeded);
  CHECK_EQUAL(unbox(feed.get_ids()), (id_list{a}));
  CHECK_EQUAL(unbox(feed.publishes()), 1u);
  CHECK(sub.poll().empty());
}

TEST(sqlite connections to the same database share one feed) {
  auto path = temp_db_path("concurrency");
  std::vector<std::shared_ptr<detail::sqlite_backend>> backends;
  std::vector<sorted_feed> feeds;
  for (size_t i = 0; i < num_threads; ++i) {
    auto backend = std::make_shared<detail::sqlite_backend>(
      backend_options{{"path", path}, {"journal_mode", "WAL"}});
    REQUIRE(!backend->init_failed());
    feeds.emplace_back(backend, "shared");
    backends.emplace_back(std::move(backend));
  }
  auto results = publish_from_threads(feeds);
  check_unique_and_increasing(results);
  CHECK_EQUAL(unbox(feeds[0].get_ids()).size(), num_threads * num_items);
  check_consistency(feeds[0]);
  feeds.clear();
  backends.clear();
  detail::remove(path);
}
