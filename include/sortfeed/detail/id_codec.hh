#pragma once

#include "sortfeed/fwd.hh"

#include <charconv>
#include <string>
#include <string_view>

namespace sortfeed::detail {

/// Renders an item ID in its decimal store representation.
inline std::string encode_id(item_id id) {
  return std::to_string(id);
}

/// Parses the decimal store representation of an item ID. Rejects empty
/// input, signs and trailing characters.
inline bool decode_id(std::string_view str, item_id& id) {
  if (str.empty())
    return false;
  auto first = str.data();
  auto last = first + str.size();
  auto [ptr, err] = std::from_chars(first, last, id);
  return err == std::errc{} && ptr == last;
}

} // namespace sortfeed::detail
