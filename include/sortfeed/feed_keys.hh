#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sortfeed {

/// Bundles the store keys and notification channels of a single feed.
struct feed_keys {
  /// Name of the feed.
  std::string name;

  /// List holding the item IDs in feed order.
  std::string order;

  /// Hash mapping item IDs to their content.
  std::string items;

  /// Counter of publish-class events.
  std::string publishes;

  /// Counter for allocating new item IDs.
  std::string id_counter;

  /// Channel for publish notifications.
  std::string publish_channel;

  /// Channel for retract notifications.
  std::string retract_channel;

  /// Derives all key roles from the feed name.
  static feed_keys make(std::string_view name);

  /// Returns the store keys of the feed (channels are not store keys).
  std::vector<std::string> schemas() const;
};

/// @relates feed_keys
std::string to_string(const feed_keys& x);

} // namespace sortfeed
