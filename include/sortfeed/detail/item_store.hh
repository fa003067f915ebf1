#pragma once

#include "sortfeed/expected.hh"
#include "sortfeed/fwd.hh"

#include <map>
#include <string>

namespace sortfeed::detail {

/// Maps the item IDs of a feed to their content. The key set of this store
/// decides whether an item exists.
class item_store {
public:
  item_store(backend_ptr backend, std::string key);

  void put(transaction& tx, item_id id, std::string content) const;

  void erase(transaction& tx, item_id id) const;

  /// @returns the content of `id` or `ec::no_such_item`.
  expected<std::string> get(item_id id) const;

  expected<bool> contains(item_id id) const;

  /// Returns a point-in-time snapshot of all items.
  expected<std::map<item_id, std::string>> all() const;

  /// Returns the current version of the store for conditioning a commit.
  expected<version_type> version() const;

  const std::string& key() const noexcept {
    return key_;
  }

private:
  backend_ptr backend_;
  std::string key_;
};

} // namespace sortfeed::detail
