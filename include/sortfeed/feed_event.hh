#pragma once

#include "sortfeed/expected.hh"
#include "sortfeed/fwd.hh"

#include <cstdint>
#include <string>
#include <string_view>

namespace sortfeed {

/// Distinguishes the two kinds of change events of a feed. Edits travel as
/// publish events.
enum class feed_event_type : uint8_t {
  publish,
  retract,
};

/// @relates feed_event_type
std::string to_string(feed_event_type x);

/// A committed change to a feed.
struct feed_event {
  feed_event_type type = feed_event_type::publish;

  item_id id = 0;

  /// Content of the item. Always empty for retract events.
  std::string content;

  static feed_event make_publish(item_id id, std::string content) {
    return feed_event{feed_event_type::publish, id, std::move(content)};
  }

  static feed_event make_retract(item_id id) {
    return feed_event{feed_event_type::retract, id, std::string{}};
  }
};

/// @relates feed_event
inline bool operator==(const feed_event& x, const feed_event& y) {
  return x.type == y.type && x.id == y.id && x.content == y.content;
}

/// @relates feed_event
inline bool operator!=(const feed_event& x, const feed_event& y) {
  return !(x == y);
}

/// @relates feed_event
std::string to_string(const feed_event& x);

/// Renders the channel payload for `x`: `<id>\0<content>` for publish events
/// and `<id>` for retract events.
std::string encode(const feed_event& x);

/// Parses the payload of a publish channel.
/// @returns the event or `ec::invalid_message`.
expected<feed_event> decode_publish(std::string_view payload);

/// Parses the payload of a retract channel.
/// @returns the event or `ec::invalid_message`.
expected<feed_event> decode_retract(std::string_view payload);

} // namespace sortfeed
