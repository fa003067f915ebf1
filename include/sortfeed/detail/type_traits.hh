#pragma once

#include <string>
#include <type_traits>
#include <utility>

namespace sortfeed::detail {

/// Checks whether an overload `convert(const From&, To&)` exists.
template <class From, class To>
struct has_convert {
  template <class T>
  static auto test(const T* x)
    -> decltype(convert(*x, std::declval<To&>()), std::true_type());

  template <class T>
  static auto test(...) -> std::false_type;

  static constexpr bool value = decltype(test<From>(nullptr))::value;
};

template <class From, class To>
inline constexpr bool has_convert_v = has_convert<From, To>::value;

/// Checks whether `to_string(const T&)` is available and returns a string.
template <class T>
class has_to_string {
private:
  template <class U>
  static auto sfinae(const U& x) -> decltype(to_string(x));

  static void sfinae(...);

  using result = decltype(sfinae(std::declval<const T&>()));

public:
  static constexpr bool value = std::is_same_v<result, std::string>;
};

template <class T>
inline constexpr bool has_to_string_v = has_to_string<T>::value;

} // namespace sortfeed::detail
