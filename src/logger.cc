#include "sortfeed/logger.hh"

#include "sortfeed/time.hh"

#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

#include <caf/term.hpp>

namespace sortfeed {

namespace {

event_observer_ptr global_observer;

class console_logger : public event_observer {
public:
  console_logger(event::severity_level severity, event::component_mask mask)
    : severity_(severity), mask_(mask) {
    // nop
  }

  void observe(event_ptr what) override {
    auto color = caf::term::reset;
    switch (what->severity) {
      case event::severity_level::critical:
      case event::severity_level::error:
        color = caf::term::red;
        break;
      case event::severity_level::warning:
        color = caf::term::yellow;
        break;
      case event::severity_level::info:
        color = caf::term::green;
        break;
      case event::severity_level::debug:
        color = caf::term::blue;
        break;
    }
    std::string ts;
    convert(what->timestamp, ts);
    std::lock_guard<std::mutex> guard{mtx_};
    std::cerr << color << '[' << enum_str(what->component) << '.'
              << what->identifier << "] " << ts << ' ' << what->description
              << caf::term::reset << std::endl;
  }

  bool accepts(event::severity_level severity,
               event::component_type component) const override {
    return severity <= severity_ && has_component(mask_, component);
  }

private:
  std::mutex mtx_;
  event::severity_level severity_;
  event::component_mask mask_;
};

} // namespace

event_observer* logger() noexcept {
  return global_observer.get();
}

void logger(event_observer_ptr ptr) noexcept {
  global_observer = std::move(ptr);
}

event_observer_ptr make_console_logger(event::severity_level severity,
                                       event::component_mask mask) {
  return std::make_shared<console_logger>(severity, mask);
}

event_observer_ptr make_console_logger(std::string_view severity,
                                       event::component_mask mask) {
  auto level = event::severity_level::info;
  if (!convert(severity, level)) {
    std::string msg = "invalid severity level: ";
    msg.insert(msg.end(), severity.begin(), severity.end());
    throw std::invalid_argument(msg);
  }
  return make_console_logger(level, mask);
}

} // namespace sortfeed
