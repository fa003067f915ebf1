#include "sortfeed/detail/abstract_backend.hh"

namespace sortfeed::detail {

abstract_backend::~abstract_backend() {
  // nop
}

expected<bool> abstract_backend::has_field(const std::string& key,
                                           const std::string& name) const {
  if (auto res = field(key, name))
    return true;
  else if (res.error() == ec::no_such_key)
    return false;
  else
    return res.error();
}

} // namespace sortfeed::detail
