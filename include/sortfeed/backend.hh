#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace sortfeed {

/// Describes the supported storage backends.
enum class backend : uint8_t {
  memory, ///< An in-process backend based on hash tables.
  sqlite, ///< A SQLite3 backend, shareable between processes.
};

/// @relates backend
std::string to_string(backend x);

/// @relates backend
bool convert(std::string_view str, backend& x) noexcept;

/// @relates backend
template <class Inspector>
bool inspect(Inspector& f, backend& x) {
  auto get = [&] { return static_cast<uint8_t>(x); };
  auto set = [&](uint8_t val) {
    if (val <= static_cast<uint8_t>(backend::sqlite)) {
      x = static_cast<backend>(val);
      return true;
    } else {
      return false;
    }
  };
  return f.apply(get, set);
}

} // namespace sortfeed
