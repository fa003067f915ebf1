#include "sortfeed/feed_keys.hh"

namespace sortfeed {

namespace {

std::string make_key(std::string_view prefix, std::string_view name) {
  std::string result;
  result.reserve(prefix.size() + name.size());
  result.insert(result.end(), prefix.begin(), prefix.end());
  result.insert(result.end(), name.begin(), name.end());
  return result;
}

} // namespace

feed_keys feed_keys::make(std::string_view name) {
  return feed_keys{
    std::string{name},
    make_key("feed.ids:", name),
    make_key("feed.items:", name),
    make_key("feed.publishes:", name),
    make_key("feed.idincr:", name),
    make_key("feed.publish:", name),
    make_key("feed.retract:", name),
  };
}

std::vector<std::string> feed_keys::schemas() const {
  return {order, items, publishes, id_counter};
}

std::string to_string(const feed_keys& x) {
  std::string result = "feed_keys(";
  result += x.name;
  result += ", order = ";
  result += x.order;
  result += ", items = ";
  result += x.items;
  result += ", publishes = ";
  result += x.publishes;
  result += ", id_counter = ";
  result += x.id_counter;
  result += ')';
  return result;
}

} // namespace sortfeed
