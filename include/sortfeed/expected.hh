// This implementation is based on caf::expected. Original implementation see:
// https://github.com/actor-framework/actor-framework/blob/0.18.5/libcaf_core/caf/expected.hpp.
//
// -- Original header ----------------------------------------------------------
// This file is part of CAF, the C++ Actor Framework. See the file LICENSE in
// the main distribution directory for license terms and copyright or visit
// https://github.com/actor-framework/actor-framework/blob/master/LICENSE.
// -----------------------------------------------------------------------------

#pragma once

#include "sortfeed/detail/assert.hh"
#include "sortfeed/error.hh"

#include <memory>
#include <new>
#include <string>
#include <type_traits>
#include <utility>

namespace sortfeed {

/// Represents the result of a computation which can either complete
/// successfully with an instance of type `T` or fail with an `error`.
/// @tparam T The type of the result.
template <typename T>
class expected {
public:
  // -- member types -----------------------------------------------------------

  using value_type = T;

  // -- static member variables ------------------------------------------------

  /// Stores whether move construct and move assign never throw.
  static constexpr bool nothrow_move =
    std::is_nothrow_move_constructible_v<T> //
    && std::is_nothrow_move_assignable_v<T>;

  /// Stores whether copy construct and copy assign never throw.
  static constexpr bool nothrow_copy =
    std::is_nothrow_copy_constructible_v<T> //
    && std::is_nothrow_copy_assignable_v<T>;

  // -- constructors, destructors, and assignment operators --------------------

  template <class U>
  expected(U x, std::enable_if_t<std::is_convertible_v<U, T>>* = nullptr)
    : engaged_(true) {
    new (std::addressof(value_)) T(std::move(x));
  }

  expected(T&& x) noexcept(nothrow_move) : engaged_(true) {
    new (std::addressof(value_)) T(std::move(x));
  }

  expected(const T& x) noexcept(nothrow_copy) : engaged_(true) {
    new (std::addressof(value_)) T(x);
  }

  expected(sortfeed::error e) noexcept : engaged_(false) {
    new (std::addressof(error_)) sortfeed::error{std::move(e)};
  }

  expected(ec code) : engaged_(false) {
    new (std::addressof(error_)) sortfeed::error(code);
  }

  expected(const expected& other) noexcept(nothrow_copy) {
    construct(other);
  }

  expected(expected&& other) noexcept(nothrow_move) {
    construct(std::move(other));
  }

  ~expected() {
    destroy();
  }

  expected& operator=(const expected& other) noexcept(nothrow_copy) {
    if (engaged_ && other.engaged_)
      value_ = other.value_;
    else if (!engaged_ && !other.engaged_)
      error_ = other.error_;
    else {
      destroy();
      construct(other);
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(nothrow_move) {
    if (engaged_ && other.engaged_)
      value_ = std::move(other.value_);
    else if (!engaged_ && !other.engaged_)
      error_ = std::move(other.error_);
    else {
      destroy();
      construct(std::move(other));
    }
    return *this;
  }

  expected& operator=(T x) noexcept(nothrow_move) {
    if (engaged_) {
      value_ = std::move(x);
    } else {
      destroy();
      engaged_ = true;
      new (std::addressof(value_)) T(std::move(x));
    }
    return *this;
  }

  expected& operator=(sortfeed::error e) noexcept {
    if (!engaged_) {
      error_ = std::move(e);
    } else {
      destroy();
      engaged_ = false;
      new (std::addressof(error_)) sortfeed::error(std::move(e));
    }
    return *this;
  }

  expected& operator=(ec code) {
    return *this = make_error(code);
  }

  // -- modifiers --------------------------------------------------------------

  /// @copydoc cvalue
  T& value() noexcept {
    SORTFEED_ASSERT(engaged_);
    return value_;
  }

  /// @copydoc cvalue
  T& operator*() noexcept {
    return value();
  }

  /// @copydoc cvalue
  T* operator->() noexcept {
    return &value();
  }

  /// @copydoc cerror
  sortfeed::error& error() noexcept {
    SORTFEED_ASSERT(!engaged_);
    return error_;
  }

  // -- observers --------------------------------------------------------------

  /// Returns the contained value.
  /// @pre `engaged() == true`.
  const T& cvalue() const noexcept {
    SORTFEED_ASSERT(engaged_);
    return value_;
  }

  /// @copydoc cvalue
  const T& value() const noexcept {
    return cvalue();
  }

  /// @copydoc cvalue
  const T& operator*() const noexcept {
    return cvalue();
  }

  /// @copydoc cvalue
  const T* operator->() const noexcept {
    return &cvalue();
  }

  /// @copydoc engaged
  explicit operator bool() const noexcept {
    return engaged();
  }

  /// Returns `true` if the object holds a value (is engaged).
  bool engaged() const noexcept {
    return engaged_;
  }

  /// Returns the contained error.
  /// @pre `engaged() == false`.
  const sortfeed::error& cerror() const noexcept {
    SORTFEED_ASSERT(!engaged_);
    return error_;
  }

  /// @copydoc cerror
  const sortfeed::error& error() const noexcept {
    return cerror();
  }

private:
  void construct(expected&& other) noexcept(nothrow_move) {
    if (other.engaged_)
      new (std::addressof(value_)) T(std::move(other.value_));
    else
      new (std::addressof(error_)) sortfeed::error(std::move(other.error_));
    engaged_ = other.engaged_;
  }

  void construct(const expected& other) noexcept(nothrow_copy) {
    if (other.engaged_)
      new (std::addressof(value_)) T(other.value_);
    else
      new (std::addressof(error_)) sortfeed::error(other.error_);
    engaged_ = other.engaged_;
  }

  void destroy() {
    if (engaged_)
      value_.~T();
    else
      error_.~error();
  }

  bool engaged_;

  union {
    T value_;
    sortfeed::error error_;
  };
};

/// @relates expected
template <class T>
auto operator==(const expected<T>& x, const expected<T>& y)
  -> decltype(*x == *y) {
  return x && y ? *x == *y : (!x && !y ? x.error() == y.error() : false);
}

/// @relates expected
template <class T, class U>
auto operator==(const expected<T>& x, const U& y) -> decltype(*x == y) {
  return x ? *x == y : false;
}

/// @relates expected
template <class T>
bool operator==(const expected<T>& x, const error& y) {
  return x ? false : x.error() == y;
}

/// @relates expected
template <class T>
bool operator==(const expected<T>& x, ec code) {
  return x ? false : x.error() == code;
}

/// @relates expected
template <class T>
bool operator==(ec code, const expected<T>& x) {
  return x == code;
}

/// @relates expected
template <class T, class U>
auto operator!=(const expected<T>& x, const U& y) -> decltype(!(x == y)) {
  return !(x == y);
}

/// @relates expected
template <class T>
std::string to_string(const expected<T>& x) {
  using std::to_string;
  if (!x)
    return "!" + to_string(x.error());
  if constexpr (std::is_same_v<T, std::string>)
    return *x;
  else
    return to_string(*x);
}

/// The pattern `expected<void>` shall be used for functions that may generate
/// an error but would otherwise return `bool`.
template <>
class expected<void> {
public:
  expected() = default;

  expected(sortfeed::error e) noexcept : error_(std::move(e)) {
    // nop
  }

  expected(ec code) : error_(code) {
    // nop
  }

  expected(const expected& other) = default;

  expected(expected&& other) noexcept = default;

  expected& operator=(const expected& other) = default;

  expected& operator=(expected&& other) noexcept = default;

  explicit operator bool() const {
    return !error_;
  }

  const sortfeed::error& error() const {
    return error_;
  }

private:
  sortfeed::error error_;
};

/// @relates expected
inline bool operator==(const expected<void>& x, const expected<void>& y) {
  return (x && y) || (!x && !y && x.error() == y.error());
}

/// @relates expected
inline bool operator==(const expected<void>& x, ec code) {
  return x ? code == ec::none : x.error() == code;
}

/// @relates expected
inline std::string to_string(const expected<void>& x) {
  if (x)
    return "unit";
  else
    return "!" + to_string(x.error());
}

} // namespace sortfeed
