#define SUITE detail.memory_backend

#include "sortfeed/detail/memory_backend.hh"

#include "test.hh"

#include "sortfeed/backend.hh"
#include "sortfeed/detail/make_backend.hh"
#include "sortfeed/detail/transaction.hh"

#include <map>
#include <string>
#include <vector>

using namespace sortfeed;
using namespace std::string_literals;

using string_list = std::vector<std::string>;

namespace {

struct fixture {
  detail::memory_backend backend;

  void commit(const detail::transaction& tx) {
    auto res = backend.commit(tx);
    if (!res)
      FAIL("commit failed: " << to_string(res.error()));
    if (!*res)
      FAIL("commit conflicted");
  }
};

} // namespace

FIXTURE_SCOPE(memory_backend_tests, fixture)

TEST(counters start at zero and increment atomically) {
  CHECK_EQUAL(unbox(backend.counter("c")), 0u);
  CHECK_EQUAL(unbox(backend.increment("c")), 1u);
  CHECK_EQUAL(unbox(backend.increment("c")), 2u);
  CHECK_EQUAL(unbox(backend.counter("c")), 2u);
  detail::transaction tx;
  tx.increment("c");
  commit(tx);
  CHECK_EQUAL(unbox(backend.counter("c")), 3u);
}

TEST(lists support pushes at both ends) {
  CHECK_EQUAL(unbox(backend.range("l")), string_list{});
  detail::transaction tx;
  tx.push_back("l", "b");
  tx.push_back("l", "c");
  tx.push_front("l", "a");
  commit(tx);
  CHECK_EQUAL(unbox(backend.range("l")), (string_list{"a", "b", "c"}));
}

TEST(lists support relative inserts and removals) {
  detail::transaction tx;
  tx.push_back("l", "a");
  tx.push_back("l", "c");
  tx.insert("l", "c", "b", insert_position::before);
  tx.insert("l", "c", "d", insert_position::after);
  tx.insert("l", "a", "0", insert_position::before);
  commit(tx);
  CHECK_EQUAL(unbox(backend.range("l")),
              (string_list{"0", "a", "b", "c", "d"}));
  tx.clear();
  tx.remove("l", "b");
  tx.remove("l", "d");
  commit(tx);
  CHECK_EQUAL(unbox(backend.range("l")), (string_list{"0", "a", "c"}));
  MESSAGE("inserting next to a missing pivot and removing a missing value "
          "does nothing");
  tx.clear();
  tx.insert("l", "x", "y", insert_position::after);
  tx.remove("l", "z");
  commit(tx);
  CHECK_EQUAL(unbox(backend.range("l")), (string_list{"0", "a", "c"}));
}

TEST(remove drops only the first occurrence) {
  detail::transaction tx;
  tx.push_back("l", "a");
  tx.push_back("l", "b");
  tx.push_back("l", "a");
  tx.remove("l", "a");
  commit(tx);
  CHECK_EQUAL(unbox(backend.range("l")), (string_list{"b", "a"}));
}

TEST(hashes map fields to values) {
  CHECK_EQUAL(backend.field("h", "x").error(), ec::no_such_key);
  CHECK(!unbox(backend.has_field("h", "x")));
  detail::transaction tx;
  tx.set_field("h", "x", "1");
  tx.set_field("h", "y", "2");
  commit(tx);
  CHECK_EQUAL(unbox(backend.field("h", "x")), "1"s);
  CHECK(unbox(backend.has_field("h", "y")));
  auto fields = std::map<std::string, std::string>{{"x", "1"}, {"y", "2"}};
  CHECK_EQUAL(unbox(backend.fields("h")), fields);
  tx.clear();
  tx.set_field("h", "x", "3");
  tx.erase_field("h", "y");
  commit(tx);
  fields = std::map<std::string, std::string>{{"x", "3"}};
  CHECK_EQUAL(unbox(backend.fields("h")), fields);
  CHECK_EQUAL(backend.field("h", "y").error(), ec::no_such_key);
}

TEST(every write bumps the version of its key) {
  CHECK_EQUAL(unbox(backend.watch("h")), 0u);
  detail::transaction tx;
  tx.set_field("h", "x", "1");
  commit(tx);
  auto v1 = unbox(backend.watch("h"));
  CHECK_GREATER(v1, 0u);
  CHECK_EQUAL(unbox(backend.watch("l")), 0u);
  tx.clear();
  tx.erase_field("h", "x");
  commit(tx);
  CHECK_GREATER(unbox(backend.watch("h")), v1);
  auto c1 = unbox(backend.watch("c"));
  unbox(backend.increment("c"));
  CHECK_GREATER(unbox(backend.watch("c")), c1);
}

TEST(commits fail without side effects if a watched key changed) {
  auto version = unbox(backend.watch("h"));
  detail::transaction tx;
  tx.watch("h", version);
  tx.set_field("h", "x", "1");
  tx.push_back("l", "x");
  MESSAGE("a concurrent writer modifies the watched key");
  detail::transaction other;
  other.set_field("h", "y", "2");
  commit(other);
  CHECK_EQUAL(unbox(backend.commit(tx)), false);
  CHECK(!unbox(backend.has_field("h", "x")));
  CHECK_EQUAL(unbox(backend.range("l")), string_list{});
  MESSAGE("the transaction succeeds after watching the new version");
  tx.clear();
  tx.watch("h", unbox(backend.watch("h")));
  tx.set_field("h", "x", "1");
  CHECK_EQUAL(unbox(backend.commit(tx)), true);
  CHECK_EQUAL(unbox(backend.field("h", "x")), "1"s);
}

TEST(writes to unwatched keys do not cause conflicts) {
  detail::transaction tx;
  tx.watch("h", unbox(backend.watch("h")));
  tx.set_field("h", "x", "1");
  unbox(backend.increment("c"));
  detail::transaction other;
  other.push_back("l", "x");
  commit(other);
  CHECK_EQUAL(unbox(backend.commit(tx)), true);
}

TEST(queued events go out with successful commits only) {
  recording_sink sink;
  detail::transaction tx;
  tx.watch("h", unbox(backend.watch("h")));
  tx.set_field("h", "1", "one");
  tx.publish(&sink, "pub", feed_event::make_publish(1, "one"));
  tx.publish(nullptr, "pub", feed_event::make_publish(1, "ignored"));
  CHECK_EQUAL(tx.notifications().size(), 1u);
  MESSAGE("a conflicting commit emits nothing");
  detail::transaction other;
  other.set_field("h", "2", "two");
  commit(other);
  CHECK_EQUAL(unbox(backend.commit(tx)), false);
  CHECK_EQUAL(sink.count(), 0u);
  MESSAGE("a successful commit emits the queued events in order");
  tx.clear();
  CHECK(tx.empty());
  tx.watch("h", unbox(backend.watch("h")));
  tx.set_field("h", "1", "one");
  tx.publish(&sink, "pub", feed_event::make_publish(1, "one"));
  tx.publish(&sink, "ret", feed_event::make_retract(2));
  CHECK_EQUAL(unbox(backend.commit(tx)), true);
  auto events = sink.events();
  REQUIRE_EQUAL(events.size(), 2u);
  CHECK_EQUAL(events[0].first, "pub"s);
  CHECK_EQUAL(events[0].second, feed_event::make_publish(1, "one"));
  CHECK_EQUAL(events[1].first, "ret"s);
  CHECK_EQUAL(events[1].second, feed_event::make_retract(2));
}

TEST(make_backend ignores options for in-memory stores) {
  auto db = detail::make_backend(sortfeed::backend::memory,
                                 backend_options{{"path", "/nonexistent"}});
  REQUIRE(db != nullptr);
  CHECK_EQUAL(unbox(db->increment("c")), 1u);
  CHECK_EQUAL(unbox(backend.counter("c")), 0u);
}

FIXTURE_SCOPE_END()
