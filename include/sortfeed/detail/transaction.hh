#pragma once

#include "sortfeed/feed_event.hh"
#include "sortfeed/fwd.hh"
#include "sortfeed/insert_position.hh"

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sortfeed::detail {

/// Collects watched key versions, queued write operations and the change events
/// they produce. A backend applies the operations atomically on `commit` if and
/// only if none of the watched keys changed in the meantime. Queued events go
/// out as part of a successful commit, before the backend admits the next
/// commit, so observers see them in commit order.
class transaction {
public:
  // -- operation types --------------------------------------------------------

  struct push_back_op {
    std::string list;
    std::string value;
  };

  struct push_front_op {
    std::string list;
    std::string value;
  };

  /// Places `value` next to the first occurrence of `pivot`. Does nothing if
  /// `pivot` is not in the list.
  struct insert_op {
    std::string list;
    std::string pivot;
    std::string value;
    insert_position position;
  };

  /// Removes the first occurrence of `value`.
  struct remove_op {
    std::string list;
    std::string value;
  };

  struct set_field_op {
    std::string hash;
    std::string field;
    std::string value;
  };

  struct erase_field_op {
    std::string hash;
    std::string field;
  };

  struct increment_op {
    std::string counter;
  };

  using operation = std::variant<push_back_op, push_front_op, insert_op,
                                 remove_op, set_field_op, erase_field_op,
                                 increment_op>;

  using watch_entry = std::pair<std::string, version_type>;

  struct notification {
    event_sink* sink;
    std::string channel;
    feed_event event;
  };

  // -- conditions -------------------------------------------------------------

  /// Conditions the commit on `key` still having `version`.
  void watch(std::string key, version_type version);

  // -- list operations --------------------------------------------------------

  void push_back(std::string list, std::string value);

  void push_front(std::string list, std::string value);

  void insert(std::string list, std::string pivot, std::string value,
              insert_position position);

  void remove(std::string list, std::string value);

  // -- hash operations --------------------------------------------------------

  void set_field(std::string hash, std::string field, std::string value);

  void erase_field(std::string hash, std::string field);

  // -- counter operations -----------------------------------------------------

  void increment(std::string counter);

  // -- notifications ----------------------------------------------------------

  /// Queues `ev` for delivery to `sink` on `channel` once the transaction
  /// commits. The sink runs while the backend still serializes commits and
  /// thus must not call back into the backend.
  void publish(event_sink* sink, std::string channel, feed_event ev);

  /// Emits all queued events. Backends call this after applying the
  /// operations of a successful commit and before admitting the next one.
  void deliver() const;

  // -- properties -------------------------------------------------------------

  const std::vector<watch_entry>& watches() const noexcept {
    return watches_;
  }

  const std::vector<operation>& operations() const noexcept {
    return ops_;
  }

  const std::vector<notification>& notifications() const noexcept {
    return notifications_;
  }

  bool empty() const noexcept {
    return ops_.empty() && notifications_.empty();
  }

  /// Drops all watches, queued operations and queued events.
  void clear();

private:
  std::vector<watch_entry> watches_;
  std::vector<operation> ops_;
  std::vector<notification> notifications_;
};

/// Returns the store key that `op` writes to.
const std::string& key_of(const transaction::operation& op);

/// @relates transaction
std::string to_string(const transaction::operation& op);

} // namespace sortfeed::detail
