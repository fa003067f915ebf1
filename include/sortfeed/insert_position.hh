#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace sortfeed {

/// Selects on which side of an anchor a relative insert places the new item.
enum class insert_position : uint8_t {
  before,
  after,
};

/// @relates insert_position
std::string to_string(insert_position x);

/// @relates insert_position
bool convert(std::string_view str, insert_position& x) noexcept;

} // namespace sortfeed
