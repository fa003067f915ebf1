#pragma once

#include "sortfeed/expected.hh"
#include "sortfeed/fwd.hh"

#include <string>
#include <vector>

namespace sortfeed::detail {

/// Maintains the ordered ID sequence of a feed. All writes are queued on a
/// transaction and take effect only when the transaction commits.
class order_store {
public:
  order_store(backend_ptr backend, std::string key);

  void append_tail(transaction& tx, item_id id) const;

  void append_head(transaction& tx, item_id id) const;

  /// Places `id` next to the first occurrence of `anchor`.
  void insert_relative(transaction& tx, item_id id, item_id anchor,
                       insert_position position) const;

  /// Removes the first occurrence of `id`.
  void remove(transaction& tx, item_id id) const;

  /// Returns a point-in-time snapshot of the sequence.
  expected<std::vector<item_id>> ids() const;

  const std::string& key() const noexcept {
    return key_;
  }

private:
  backend_ptr backend_;
  std::string key_;
};

} // namespace sortfeed::detail
