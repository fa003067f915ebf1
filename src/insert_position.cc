#include "sortfeed/insert_position.hh"

namespace sortfeed {

std::string to_string(insert_position x) {
  return x == insert_position::before ? "before" : "after";
}

bool convert(std::string_view str, insert_position& x) noexcept {
  if (str == "before") {
    x = insert_position::before;
    return true;
  }
  if (str == "after") {
    x = insert_position::after;
    return true;
  }
  return false;
}

} // namespace sortfeed
