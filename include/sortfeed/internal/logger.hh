#pragma once

#include "sortfeed/detail/type_traits.hh"
#include "sortfeed/event.hh"
#include "sortfeed/event_observer.hh"
#include "sortfeed/logger.hh"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace sortfeed::internal {

// -- poor man's std::format replacement; remove once we can use C++20 ---------

template <class OutputIterator>
OutputIterator fmt_to(OutputIterator out, std::string_view fmt) {
  return std::copy(fmt.begin(), fmt.end(), out);
}

template <class OutputIterator, class T, class... Ts>
OutputIterator fmt_to(OutputIterator out, std::string_view fmt, const T& arg,
                      const Ts&... args) {
  if (fmt.empty())
    return out;
  if (fmt.size() == 1) {
    *out++ = fmt[0];
    return out;
  }
  auto index = size_t{0};
  auto ch = fmt[index];
  auto lookahead = fmt[index + 1];
  auto next = [&] {
    ch = lookahead;
    ++index;
    if (index + 1 < fmt.size())
      lookahead = fmt[index + 1];
    else
      lookahead = '\0';
  };
  while (index < fmt.size()) {
    switch (ch) {
      // Must be "{}" (placeholder) or "{{" (escaped '{').
      case '{':
        if (lookahead == '{') {
          *out++ = '{';
          next();
          break;
        }
        if (lookahead == '}') {
          if constexpr (std::is_same_v<T, bool>) {
            std::string_view str = arg ? "true" : "false";
            out = std::copy(str.begin(), str.end(), out);
          } else if constexpr (std::is_arithmetic_v<T>) {
            auto str = std::to_string(arg);
            out = std::copy(str.begin(), str.end(), out);
          } else if constexpr (std::is_same_v<T, std::string>
                               || std::is_same_v<T, std::string_view>) {
            out = std::copy(arg.begin(), arg.end(), out);
          } else if constexpr (detail::has_convert_v<T, std::string>) {
            auto str = std::string{};
            convert(arg, str);
            out = std::copy(str.begin(), str.end(), out);
          } else if constexpr (detail::has_to_string_v<T>) {
            auto str = to_string(arg);
            out = std::copy(str.begin(), str.end(), out);
          } else {
            static_assert(std::is_convertible_v<T, const char*>);
            for (const char* cstr = arg; *cstr != '\0'; ++cstr)
              *out++ = *cstr;
          }
          return fmt_to(out, fmt.substr(index + 2), args...);
        }
        throw std::invalid_argument("invalid format string");
      // Must be "}}" (escaped '}').
      case '}':
        if (lookahead == '}') {
          *out++ = '}';
          next();
          break;
        }
        throw std::invalid_argument("invalid format string");
      default:
        *out++ = ch;
        break;
    }
    next();
  }
  throw std::invalid_argument("format string ended unexpectedly");
}

template <class... Ts>
void do_log(event::severity_level level, event::component_type component,
            std::string_view identifier, std::string_view fmt_str,
            Ts&&... args) {
  auto lptr = logger();
  if (!lptr || !lptr->accepts(level, component)) {
    // Short-circuit if no observer is interested in the event.
    return;
  }
  auto msg = std::string{};
  msg.reserve(fmt_str.size() + sizeof...(Ts) * 8);
  fmt_to(std::back_inserter(msg), fmt_str, std::forward<Ts>(args)...);
  lptr->observe(
    std::make_shared<event>(level, component, identifier, std::move(msg)));
}

} // namespace sortfeed::internal

/// Generates functions for logging messages with a specific component type.
#define SORTFEED_DECLARE_LOG_COMPONENT(name)                                   \
  namespace sortfeed::internal::log::name {                                    \
  constexpr auto component = event::component_type::name;                      \
  template <class... Ts>                                                       \
  void critical(std::string_view identifier, std::string_view fmt_str,         \
                Ts&&... args) {                                                \
    do_log(event::severity_level::critical, component, identifier, fmt_str,    \
           std::forward<Ts>(args)...);                                         \
  }                                                                            \
  template <class... Ts>                                                       \
  void error(std::string_view identifier, std::string_view fmt_str,            \
             Ts&&... args) {                                                   \
    do_log(event::severity_level::error, component, identifier, fmt_str,       \
           std::forward<Ts>(args)...);                                         \
  }                                                                            \
  template <class... Ts>                                                       \
  void warning(std::string_view identifier, std::string_view fmt_str,          \
               Ts&&... args) {                                                 \
    do_log(event::severity_level::warning, component, identifier, fmt_str,     \
           std::forward<Ts>(args)...);                                         \
  }                                                                            \
  template <class... Ts>                                                       \
  void info(std::string_view identifier, std::string_view fmt_str,             \
            Ts&&... args) {                                                    \
    do_log(event::severity_level::info, component, identifier, fmt_str,        \
           std::forward<Ts>(args)...);                                         \
  }                                                                            \
  template <class... Ts>                                                       \
  void debug(std::string_view identifier, std::string_view fmt_str,            \
             Ts&&... args) {                                                   \
    do_log(event::severity_level::debug, component, identifier, fmt_str,       \
           std::forward<Ts>(args)...);                                         \
  }                                                                            \
  }

SORTFEED_DECLARE_LOG_COMPONENT(feed)

SORTFEED_DECLARE_LOG_COMPONENT(store)

SORTFEED_DECLARE_LOG_COMPONENT(notify)

SORTFEED_DECLARE_LOG_COMPONENT(app)

#undef SORTFEED_DECLARE_LOG_COMPONENT
