#include "sortfeed/sorted_feed.hh"

#include "sortfeed/detail/abstract_backend.hh"
#include "sortfeed/detail/exponential_backoff_retry_policy.hh"
#include "sortfeed/detail/id_codec.hh"
#include "sortfeed/detail/transaction.hh"
#include "sortfeed/feed_event.hh"
#include "sortfeed/internal/logger.hh"

namespace sortfeed {

namespace log = internal::log;

sorted_feed::sorted_feed(detail::backend_ptr backend, std::string_view name,
                         event_sink_ptr sink, retry_options retry)
  : keys_(feed_keys::make(name)),
    backend_(std::move(backend)),
    id_allocator_(backend_, keys_.id_counter),
    order_(backend_, keys_.order),
    items_(backend_, keys_.items),
    sink_(std::move(sink)),
    retry_(std::move(retry)) {
  // nop
}

// --- unconditional mutations -------------------------------------------------

expected<item_id> sorted_feed::publish(std::string content) {
  return push(std::move(content), false);
}

expected<item_id> sorted_feed::append(std::string content) {
  return push(std::move(content), false);
}

expected<item_id> sorted_feed::prepend(std::string content) {
  return push(std::move(content), true);
}

expected<item_id> sorted_feed::push(std::string content, bool at_head) {
  auto id = id_allocator_.next_id();
  if (!id) {
    log::feed::error("allocate-failed", "{}: failed to allocate an ID: {}",
                     name(), id.error());
    return id.error();
  }
  auto ev = feed_event::make_publish(*id, std::move(content));
  detail::transaction tx;
  if (at_head)
    order_.append_head(tx, *id);
  else
    order_.append_tail(tx, *id);
  tx.increment(keys_.publishes);
  items_.put(tx, *id, ev.content);
  notify(tx, keys_.publish_channel, ev);
  auto committed = backend_->commit(tx);
  if (!committed) {
    log::feed::error("commit-failed", "{}: failed to commit item {}: {}",
                     name(), *id, committed.error());
    return committed.error();
  }
  if (!*committed) {
    // Transactions without watches never conflict.
    log::feed::critical("unconditional-conflict",
                        "{}: backend rejected an unconditional commit",
                        name());
    return make_error(ec::logic_error,
                      "backend rejected an unconditional commit");
  }
  log::feed::debug("publish", "{}: {} item {}", name(),
                   at_head ? "prepended" : "appended", *id);
  return *id;
}

// --- conditional mutations ---------------------------------------------------

template <class Build>
expected<void> sorted_feed::check_then_act(std::string_view what,
                                           item_id target, Build build) {
  detail::exponential_backoff_retry_policy policy{retry_};
  for (;;) {
    auto version = items_.version();
    if (!version)
      return version.error();
    auto exists = items_.contains(target);
    if (!exists)
      return exists.error();
    if (!*exists) {
      log::feed::debug("no-such-item", "{}: {} failed, item {} does not exist",
                       name(), what, target);
      return make_error(ec::no_such_item,
                        "no item with ID " + detail::encode_id(target));
    }
    detail::transaction tx;
    tx.watch(items_.key(), *version);
    build(tx);
    auto committed = backend_->commit(tx);
    if (!committed) {
      log::feed::error("commit-failed", "{}: {} failed to commit: {}", name(),
                       what, committed.error());
      return committed.error();
    }
    if (*committed)
      return {};
    if (policy() == detail::retry_policy_result::abort) {
      log::feed::warning("retry-limit-exceeded",
                         "{}: {} gave up after {} attempts", name(), what,
                         policy.attempts());
      return make_error(ec::retry_limit_exceeded,
                        std::string{what} + " gave up after "
                          + std::to_string(policy.attempts()) + " attempts");
    }
    log::feed::debug("retry", "{}: {} conflicted, retry in {}", name(), what,
                     to_string(policy.delay()));
    policy.wait();
  }
}

expected<item_id> sorted_feed::publish_before(item_id anchor,
                                              std::string content) {
  return publish_relative(anchor, std::move(content), insert_position::before);
}

expected<item_id> sorted_feed::publish_after(item_id anchor,
                                             std::string content) {
  return publish_relative(anchor, std::move(content), insert_position::after);
}

expected<item_id> sorted_feed::publish_relative(item_id anchor,
                                                std::string content,
                                                insert_position position) {
  // The ID is allocated up front and simply discarded if the anchor is
  // missing, leaving a gap in the sequence.
  auto id = id_allocator_.next_id();
  if (!id) {
    log::feed::error("allocate-failed", "{}: failed to allocate an ID: {}",
                     name(), id.error());
    return id.error();
  }
  auto ev = feed_event::make_publish(*id, std::move(content));
  auto res = check_then_act("publish_" + to_string(position), anchor,
                            [&](detail::transaction& tx) {
                              order_.insert_relative(tx, *id, anchor,
                                                     position);
                              items_.put(tx, *id, ev.content);
                              notify(tx, keys_.publish_channel, ev);
                            });
  if (!res)
    return res.error();
  log::feed::debug("publish-relative", "{}: inserted item {} {} {}", name(),
                   *id, position, anchor);
  return *id;
}

expected<void> sorted_feed::edit(item_id id, std::string content) {
  auto ev = feed_event::make_publish(id, std::move(content));
  auto res = check_then_act("edit", id, [&](detail::transaction& tx) {
    items_.put(tx, id, ev.content);
    tx.increment(keys_.publishes);
    notify(tx, keys_.publish_channel, ev);
  });
  if (!res)
    return res;
  log::feed::debug("edit", "{}: edited item {}", name(), id);
  return res;
}

expected<void> sorted_feed::retract(item_id id) {
  auto res = check_then_act("retract", id, [&](detail::transaction& tx) {
    order_.remove(tx, id);
    items_.erase(tx, id);
    notify(tx, keys_.retract_channel, feed_event::make_retract(id));
  });
  if (!res)
    return res;
  log::feed::debug("retract", "{}: retracted item {}", name(), id);
  return res;
}

// --- queries -----------------------------------------------------------------

expected<std::vector<item_id>> sorted_feed::get_ids() const {
  return order_.ids();
}

expected<std::string> sorted_feed::get_item(item_id id) const {
  return items_.get(id);
}

expected<std::map<item_id, std::string>> sorted_feed::get_items() const {
  return items_.all();
}

expected<uint64_t> sorted_feed::publishes() const {
  return backend_->counter(keys_.publishes);
}

std::vector<std::string> sorted_feed::schemas() const {
  return keys_.schemas();
}

// --- utility -----------------------------------------------------------------

void sorted_feed::notify(detail::transaction& tx, const std::string& channel,
                         const feed_event& ev) {
  tx.publish(sink_.get(), channel, ev);
}

} // namespace sortfeed
