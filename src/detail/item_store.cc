#include "sortfeed/detail/item_store.hh"

#include "sortfeed/detail/abstract_backend.hh"
#include "sortfeed/detail/id_codec.hh"
#include "sortfeed/detail/transaction.hh"
#include "sortfeed/internal/logger.hh"

namespace sortfeed::detail {

item_store::item_store(backend_ptr backend, std::string key)
  : backend_(std::move(backend)), key_(std::move(key)) {
  // nop
}

void item_store::put(transaction& tx, item_id id, std::string content) const {
  tx.set_field(key_, encode_id(id), std::move(content));
}

void item_store::erase(transaction& tx, item_id id) const {
  tx.erase_field(key_, encode_id(id));
}

expected<std::string> item_store::get(item_id id) const {
  auto res = backend_->field(key_, encode_id(id));
  if (!res && res.error() == ec::no_such_key)
    return ec::no_such_item;
  return res;
}

expected<bool> item_store::contains(item_id id) const {
  return backend_->has_field(key_, encode_id(id));
}

expected<std::map<item_id, std::string>> item_store::all() const {
  auto fields = backend_->fields(key_);
  if (!fields)
    return fields.error();
  std::map<item_id, std::string> result;
  for (auto& [field, content] : *fields) {
    item_id id = 0;
    if (!decode_id(field, id)) {
      internal::log::store::error("invalid-item-field",
                                  "hash {} contains a non-ID field: {}", key_,
                                  field);
      return make_error(ec::invalid_data, "invalid field in " + key_);
    }
    result.emplace(id, std::move(content));
  }
  return result;
}

expected<version_type> item_store::version() const {
  return backend_->watch(key_);
}

} // namespace sortfeed::detail
