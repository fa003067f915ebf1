#pragma once

#include "sortfeed/fwd.hh"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace sortfeed {

/// Error codes of the sortfeed library.
// --ec-enum-start
enum class ec : uint8_t {
  /// Not-an-error.
  none,
  /// The unspecified default error code.
  unspecified = 1,
  /// The referenced item (anchor or target) does not exist in the feed.
  no_such_item,
  /// The given store key or hash field does not exist.
  no_such_key,
  /// The storage backend failed to execute the operation.
  backend_failure,
  /// A value read from the store cannot be interpreted.
  invalid_data,
  /// An optimistic transaction kept conflicting until the configured retry
  /// bound ran out.
  retry_limit_exceeded,
  /// Received a malformed notification payload.
  invalid_message,
  /// A caller passed an argument outside of the accepted domain.
  invalid_argument,
  /// Opening a file failed.
  cannot_open_file,
  /// Reached a state that should be unreachable.
  logic_error = 10,
};
// --ec-enum-end

/// Returns the 16-bit type ID that an @ref error stores if the 8-bit code
/// belongs to an @ref ec.
[[nodiscard]] uint16_t ec_category() noexcept;

/// Stores an error code along with an optional, human-readable description.
class error {
public:
  /// Opaque implementation type.
  struct impl;

  error();

  error(ec code);

  error(ec code, std::string description);

  explicit error(const impl* other);

  error(const error& other);

  error(error&& other) noexcept;

  error& operator=(const error& other);

  error& operator=(error&& other) noexcept;

  ~error();

  /// Returns `valid()`.
  explicit operator bool() const noexcept {
    return valid();
  }

  /// Returns `!valid()`.
  bool operator!() const noexcept {
    return !valid();
  }

  /// Checks whether this instance stores an actual error or represents the
  /// `NULL` state.
  [[nodiscard]] bool valid() const noexcept;

  /// Returns the category-specific error code, whereas `0` means "no error".
  /// @pre `valid()`
  [[nodiscard]] uint8_t code() const noexcept;

  /// Returns the category for this error encoded as 16-bit "type ID".
  /// @pre `valid()`
  [[nodiscard]] uint16_t category() const noexcept;

  /// Returns the user-defined error message if present, `nullptr` otherwise.
  const std::string* message() const noexcept;

  /// Returns a pointer to the native representation.
  [[nodiscard]] impl* native_ptr() noexcept;

  /// Returns a pointer to the native representation.
  [[nodiscard]] const impl* native_ptr() const noexcept;

  /// Compares `this` to `other`.
  /// @returns a negative value if `*this < other`, zero if `*this == other`,
  /// and a positive value if `*this > other`.
  [[nodiscard]] int compare(const error& other) const noexcept;

  [[nodiscard]] int compare(uint8_t code, uint16_t category) const noexcept;

  [[nodiscard]] int compare(ec code) const noexcept {
    return compare(static_cast<uint8_t>(code), ec_category());
  }

private:
  std::byte obj_[sizeof(void*)];
};

/// @relates error
inline bool operator==(const error& x, const error& y) noexcept {
  return x.compare(y) == 0;
}

/// @relates error
inline bool operator!=(const error& x, const error& y) noexcept {
  return x.compare(y) != 0;
}

/// @relates error
inline bool operator==(const error& x, ec y) noexcept {
  return x.compare(y) == 0;
}

/// @relates error
inline bool operator==(ec x, const error& y) noexcept {
  return y.compare(x) == 0;
}

/// @relates error
inline bool operator!=(const error& x, ec y) noexcept {
  return x.compare(y) != 0;
}

/// @relates error
inline bool operator!=(ec x, const error& y) noexcept {
  return y.compare(x) != 0;
}

/// @relates error
void convert(const error& in, std::string& out);

/// @relates error
std::string to_string(const error& x);

/// Creates a new @ref error from given @ref ec code.
inline error make_error(ec code) {
  return error{code};
}

/// Creates a new @ref error from given @ref ec @p code and @p description.
inline error make_error(ec code, std::string description) {
  return error{code, std::move(description)};
}

/// @relates ec
std::string to_string(ec code);

/// @relates ec
std::string_view enum_str(ec code);

/// @relates ec
bool convert(std::string_view str, ec& code) noexcept;

/// @relates ec
inline bool convert(const std::string& str, ec& code) noexcept {
  return convert(std::string_view{str}, code);
}

/// @relates ec
bool convertible_to_ec(uint8_t src) noexcept;

/// @relates ec
template <class Inspector>
bool inspect(Inspector& f, ec& x) {
  auto get = [&] { return static_cast<uint8_t>(x); };
  auto set = [&](uint8_t val) {
    if (convertible_to_ec(val)) {
      x = static_cast<ec>(val);
      return true;
    } else {
      return false;
    }
  };
  return f.apply(get, set);
}

} // namespace sortfeed
