#define SUITE feed_keys

#include "sortfeed/feed_keys.hh"

#include "test.hh"

#include <string>
#include <vector>

using namespace sortfeed;
using namespace std::string_literals;

TEST(all keys derive from the feed name) {
  auto keys = feed_keys::make("news");
  CHECK_EQUAL(keys.name, "news"s);
  CHECK_EQUAL(keys.order, "feed.ids:news"s);
  CHECK_EQUAL(keys.items, "feed.items:news"s);
  CHECK_EQUAL(keys.publishes, "feed.publishes:news"s);
  CHECK_EQUAL(keys.id_counter, "feed.idincr:news"s);
  CHECK_EQUAL(keys.publish_channel, "feed.publish:news"s);
  CHECK_EQUAL(keys.retract_channel, "feed.retract:news"s);
}

TEST(schemas lists the store keys but not the channels) {
  auto keys = feed_keys::make("news");
  auto expected_keys = std::vector<std::string>{
    "feed.ids:news",
    "feed.items:news",
    "feed.publishes:news",
    "feed.idincr:news",
  };
  CHECK_EQUAL(keys.schemas(), expected_keys);
}

TEST(different feeds never share keys) {
  auto xs = feed_keys::make("a").schemas();
  auto ys = feed_keys::make("b").schemas();
  for (auto& x : xs)
    for (auto& y : ys)
      CHECK_NOT_EQUAL(x, y);
}
