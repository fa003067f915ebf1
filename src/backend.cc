#include "sortfeed/backend.hh"

namespace sortfeed {

std::string to_string(backend x) {
  switch (x) {
    case backend::memory:
      return "memory";
    case backend::sqlite:
      return "sqlite";
  }
  return "???";
}

bool convert(std::string_view str, backend& x) noexcept {
  if (str == "memory") {
    x = backend::memory;
    return true;
  }
  if (str == "sqlite") {
    x = backend::sqlite;
    return true;
  }
  return false;
}

} // namespace sortfeed
