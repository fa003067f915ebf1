#pragma once

#include "sortfeed/fwd.hh"

#include <string>

namespace sortfeed {

/// Receives the change events of a feed. A feed calls `emit` exactly once per
/// committed mutation, after the commit and never for aborted mutations.
class event_sink {
public:
  virtual ~event_sink();

  /// Delivers `ev` on `channel`.
  /// @note Backends call this member function from the thread that committed
  ///       the mutation while still serializing commits, i.e.,
  ///       implementations must be thread-safe and must not access the
  ///       backend.
  virtual void emit(const std::string& channel, const feed_event& ev) = 0;
};

} // namespace sortfeed
