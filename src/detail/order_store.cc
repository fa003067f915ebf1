#include "sortfeed/detail/order_store.hh"

#include "sortfeed/detail/abstract_backend.hh"
#include "sortfeed/detail/id_codec.hh"
#include "sortfeed/detail/transaction.hh"
#include "sortfeed/internal/logger.hh"

namespace sortfeed::detail {

order_store::order_store(backend_ptr backend, std::string key)
  : backend_(std::move(backend)), key_(std::move(key)) {
  // nop
}

void order_store::append_tail(transaction& tx, item_id id) const {
  tx.push_back(key_, encode_id(id));
}

void order_store::append_head(transaction& tx, item_id id) const {
  tx.push_front(key_, encode_id(id));
}

void order_store::insert_relative(transaction& tx, item_id id, item_id anchor,
                                  insert_position position) const {
  tx.insert(key_, encode_id(anchor), encode_id(id), position);
}

void order_store::remove(transaction& tx, item_id id) const {
  tx.remove(key_, encode_id(id));
}

expected<std::vector<item_id>> order_store::ids() const {
  auto xs = backend_->range(key_);
  if (!xs)
    return xs.error();
  std::vector<item_id> result;
  result.reserve(xs->size());
  for (const auto& x : *xs) {
    item_id id = 0;
    if (!decode_id(x, id)) {
      internal::log::store::error("invalid-order-entry",
                                  "list {} contains a non-ID entry: {}", key_,
                                  x);
      return make_error(ec::invalid_data, "invalid entry in " + key_);
    }
    result.push_back(id);
  }
  return result;
}

} // namespace sortfeed::detail
