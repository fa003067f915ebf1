#include "sortfeed/event.hh"

#include <iterator>

namespace sortfeed {

namespace {

constexpr std::string_view severity_names[] = {
  "critical", "error", "warning", "info", "debug",
};

} // namespace

std::string_view enum_str(event::severity_level level) {
  return severity_names[static_cast<size_t>(level)];
}

std::string_view enum_str(event::component_type component) {
  switch (component) {
    case event::component_type::feed:
      return "feed";
    case event::component_type::store:
      return "store";
    case event::component_type::notify:
      return "notify";
    default:
      return "app";
  }
}

bool convert(std::string_view str, event::severity_level& level) noexcept {
  for (size_t index = 0; index < std::size(severity_names); ++index) {
    if (severity_names[index] == str) {
      level = static_cast<event::severity_level>(index);
      return true;
    }
  }
  return false;
}

} // namespace sortfeed
