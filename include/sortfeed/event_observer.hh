#pragma once

#include "sortfeed/event.hh"
#include "sortfeed/fwd.hh"

#include <memory>

namespace sortfeed {

/// An interface for observing internal events in sortfeed.
class event_observer {
public:
  virtual ~event_observer();

  /// Called to notify the observer about a new event.
  /// @param what The event that sortfeed has emitted.
  /// @note This member function is called from multiple threads and thus must
  ///       be thread-safe.
  virtual void observe(event_ptr what) = 0;

  /// Returns true if the observer is interested in events of the given severity
  /// and component type. Returning false will cause sortfeed to not generate
  /// filtered events.
  virtual bool accepts(event::severity_level severity,
                       event::component_type component) const = 0;
};

} // namespace sortfeed
