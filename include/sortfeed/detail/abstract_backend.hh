#pragma once

#include "sortfeed/expected.hh"
#include "sortfeed/fwd.hh"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace sortfeed::detail {

/// Abstract base class for a transactional storage backend. Keys live in three
/// disjoint spaces (counters, lists and hashes) and every key carries a
/// version that each committed write bumps.
class abstract_backend {
public:
  abstract_backend() = default;

  virtual ~abstract_backend();

  // --- modifiers ------------------------------------------------------------

  /// Atomically increments the counter at `key`, creating it at zero first.
  /// @returns the new value.
  virtual expected<uint64_t> increment(const std::string& key) = 0;

  /// Applies all operations of `tx` atomically if every watched key still has
  /// the watched version. On success, calls `tx.deliver()` before admitting
  /// any other commit through this instance.
  /// @returns `true` if the transaction took effect, `false` on a conflict.
  virtual expected<bool> commit(const transaction& tx) = 0;

  // --- inspectors -----------------------------------------------------------

  /// Retrieves the value of a counter or 0 if the counter does not exist.
  virtual expected<uint64_t> counter(const std::string& key) const = 0;

  /// Retrieves all elements of the list at `key` in order.
  virtual expected<std::vector<std::string>>
  range(const std::string& key) const = 0;

  /// Retrieves a single field of the hash at `key`.
  /// @returns the value or `ec::no_such_key` if the field does not exist.
  virtual expected<std::string> field(const std::string& key,
                                      const std::string& name) const = 0;

  /// Checks whether the hash at `key` has a field called `name`.
  virtual expected<bool> has_field(const std::string& key,
                                   const std::string& name) const;

  /// Retrieves all fields of the hash at `key`.
  virtual expected<std::map<std::string, std::string>>
  fields(const std::string& key) const = 0;

  /// Retrieves the current version of `key` for passing it to
  /// `transaction::watch`. Keys that were never written have version 0.
  virtual expected<version_type> watch(const std::string& key) const = 0;
};

} // namespace sortfeed::detail
