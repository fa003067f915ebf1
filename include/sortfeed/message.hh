#pragma once

#include <string>

namespace sortfeed {

/// A notification as delivered to a subscriber: the channel it was emitted on
/// plus the encoded event.
struct message {
  std::string channel;
  std::string payload;
};

/// @relates message
inline bool operator==(const message& x, const message& y) {
  return x.channel == y.channel && x.payload == y.payload;
}

/// @relates message
inline bool operator!=(const message& x, const message& y) {
  return !(x == y);
}

/// @relates message
std::string to_string(const message& x);

} // namespace sortfeed
