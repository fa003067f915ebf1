#pragma once

#include "sortfeed/expected.hh"
#include "sortfeed/fwd.hh"

#include <string>

namespace sortfeed::detail {

/// Hands out strictly increasing item IDs by atomically incrementing a store
/// counter. IDs are never returned: an ID that an aborted mutation received
/// simply leaves a gap.
class id_allocator {
public:
  id_allocator(backend_ptr backend, std::string key);

  /// Allocates a new ID.
  expected<item_id> next_id();

  /// Returns the most recently allocated ID or 0 if none exists yet.
  expected<item_id> last_id() const;

  const std::string& key() const noexcept {
    return key_;
  }

private:
  backend_ptr backend_;
  std::string key_;
};

} // namespace sortfeed::detail
