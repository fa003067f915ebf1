#pragma once

#include "sortfeed/detail/id_allocator.hh"
#include "sortfeed/detail/item_store.hh"
#include "sortfeed/detail/order_store.hh"
#include "sortfeed/expected.hh"
#include "sortfeed/feed_keys.hh"
#include "sortfeed/fwd.hh"
#include "sortfeed/insert_position.hh"
#include "sortfeed/retry_options.hh"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace sortfeed {

/// A manually ordered, persisted collection of items. Each item receives a
/// strictly increasing ID and its position is chosen explicitly by appending,
/// prepending or inserting relative to an existing item.
///
/// A `sorted_feed` keeps no state besides the names of its store keys. Any
/// number of instances, in any number of threads or processes, may operate on
/// the same feed as long as they share the backing store. Conditional
/// mutations use optimistic transactions: they watch the item map, check
/// their precondition and commit only if nobody modified the item map in the
/// meantime, retrying otherwise.
///
/// Each committed mutation emits exactly one event to the sink, if present.
/// The backend emits it while committing, so a sink observes the events of one
/// backend instance in commit order.
class sorted_feed {
public:
  // --- constructors ----------------------------------------------------------

  /// @param backend The shared backing store.
  /// @param name The name of the feed.
  /// @param sink Receives change events. May be `nullptr`.
  /// @param retry Bounds and delays for retrying conflicting transactions.
  sorted_feed(detail::backend_ptr backend, std::string_view name,
              event_sink_ptr sink = nullptr, retry_options retry = {});

  // --- unconditional mutations -----------------------------------------------

  /// Adds an item to the end of the feed.
  /// @returns the ID of the new item.
  expected<item_id> publish(std::string content);

  /// Adds an item to the end of the feed. Same as `publish`.
  expected<item_id> append(std::string content);

  /// Adds an item to the beginning of the feed.
  /// @returns the ID of the new item.
  expected<item_id> prepend(std::string content);

  // --- conditional mutations -------------------------------------------------

  /// Adds an item immediately before `anchor`.
  /// @returns the ID of the new item or `ec::no_such_item` if `anchor` does
  ///          not exist. The ID allocated for the failed insert is discarded.
  expected<item_id> publish_before(item_id anchor, std::string content);

  /// Adds an item immediately after `anchor`.
  /// @returns the ID of the new item or `ec::no_such_item` if `anchor` does
  ///          not exist. The ID allocated for the failed insert is discarded.
  expected<item_id> publish_after(item_id anchor, std::string content);

  /// Adds an item next to `anchor`.
  expected<item_id> publish_relative(item_id anchor, std::string content,
                                     insert_position position);

  /// Replaces the content of `id` in place. Emits a publish event.
  /// @returns `ec::no_such_item` if `id` does not exist.
  expected<void> edit(item_id id, std::string content);

  /// Removes `id` from the feed.
  /// @returns `ec::no_such_item` if `id` does not exist.
  expected<void> retract(item_id id);

  // --- queries ---------------------------------------------------------------

  /// Returns the IDs of all items in feed order.
  expected<std::vector<item_id>> get_ids() const;

  /// Returns the content of `id` or `ec::no_such_item`.
  expected<std::string> get_item(item_id id) const;

  /// Returns all items, keyed by ID.
  expected<std::map<item_id, std::string>> get_items() const;

  /// Returns the number of publish-class events (publish, prepend and edit).
  expected<uint64_t> publishes() const;

  /// Returns the store keys used by this feed.
  std::vector<std::string> schemas() const;

  // --- properties ------------------------------------------------------------

  const std::string& name() const noexcept {
    return keys_.name;
  }

  const feed_keys& keys() const noexcept {
    return keys_;
  }

  const retry_options& retry() const noexcept {
    return retry_;
  }

private:
  expected<item_id> push(std::string content, bool at_head);

  /// Runs the optimistic check-then-act loop for `target`. Calls `build` to
  /// fill the transaction once the target exists.
  template <class Build>
  expected<void> check_then_act(std::string_view what, item_id target,
                                Build build);

  /// Queues `ev` on `tx` for the sink, if present. The backend emits it as
  /// part of a successful commit.
  void notify(detail::transaction& tx, const std::string& channel,
              const feed_event& ev);

  feed_keys keys_;
  detail::backend_ptr backend_;
  detail::id_allocator id_allocator_;
  detail::order_store order_;
  detail::item_store items_;
  event_sink_ptr sink_;
  retry_options retry_;
};

} // namespace sortfeed
