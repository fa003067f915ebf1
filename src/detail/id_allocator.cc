#include "sortfeed/detail/id_allocator.hh"

#include "sortfeed/detail/abstract_backend.hh"

namespace sortfeed::detail {

id_allocator::id_allocator(backend_ptr backend, std::string key)
  : backend_(std::move(backend)), key_(std::move(key)) {
  // nop
}

expected<item_id> id_allocator::next_id() {
  return backend_->increment(key_);
}

expected<item_id> id_allocator::last_id() const {
  return backend_->counter(key_);
}

} // namespace sortfeed::detail
