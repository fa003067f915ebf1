#include "sortfeed/detail/memory_backend.hh"

#include "sortfeed/detail/overload.hh"
#include "sortfeed/internal/logger.hh"

#include <algorithm>
#include <iterator>

namespace sortfeed::detail {

expected<uint64_t> memory_backend::increment(const std::string& key) {
  std::lock_guard<std::mutex> guard{mtx_};
  bump(key);
  return ++counters_[key];
}

expected<bool> memory_backend::commit(const transaction& tx) {
  std::lock_guard<std::mutex> guard{mtx_};
  for (const auto& [key, version] : tx.watches()) {
    auto i = versions_.find(key);
    auto current = i == versions_.end() ? version_type{0} : i->second;
    if (current != version) {
      internal::log::store::debug("commit-conflict",
                                  "key {} changed from version {} to {}", key,
                                  version, current);
      return false;
    }
  }
  for (const auto& op : tx.operations())
    apply(op);
  tx.deliver();
  return true;
}

expected<uint64_t> memory_backend::counter(const std::string& key) const {
  std::lock_guard<std::mutex> guard{mtx_};
  if (auto i = counters_.find(key); i != counters_.end())
    return i->second;
  return uint64_t{0};
}

expected<std::vector<std::string>>
memory_backend::range(const std::string& key) const {
  std::lock_guard<std::mutex> guard{mtx_};
  std::vector<std::string> result;
  if (auto i = lists_.find(key); i != lists_.end())
    result.assign(i->second.begin(), i->second.end());
  return result;
}

expected<std::string> memory_backend::field(const std::string& key,
                                            const std::string& name) const {
  std::lock_guard<std::mutex> guard{mtx_};
  auto i = hashes_.find(key);
  if (i == hashes_.end())
    return ec::no_such_key;
  auto j = i->second.find(name);
  if (j == i->second.end())
    return ec::no_such_key;
  return j->second;
}

expected<bool> memory_backend::has_field(const std::string& key,
                                         const std::string& name) const {
  std::lock_guard<std::mutex> guard{mtx_};
  auto i = hashes_.find(key);
  return i != hashes_.end() && i->second.count(name) > 0;
}

expected<std::map<std::string, std::string>>
memory_backend::fields(const std::string& key) const {
  std::lock_guard<std::mutex> guard{mtx_};
  if (auto i = hashes_.find(key); i != hashes_.end())
    return i->second;
  return std::map<std::string, std::string>{};
}

expected<version_type> memory_backend::watch(const std::string& key) const {
  std::lock_guard<std::mutex> guard{mtx_};
  if (auto i = versions_.find(key); i != versions_.end())
    return i->second;
  return version_type{0};
}

void memory_backend::apply(const transaction::operation& op) {
  auto f = overload{
    [this](const transaction::push_back_op& x) {
      lists_[x.list].push_back(x.value);
    },
    [this](const transaction::push_front_op& x) {
      lists_[x.list].push_front(x.value);
    },
    [this](const transaction::insert_op& x) {
      auto& xs = lists_[x.list];
      auto i = std::find(xs.begin(), xs.end(), x.pivot);
      if (i == xs.end())
        return;
      if (x.position == insert_position::after)
        ++i;
      xs.insert(i, x.value);
    },
    [this](const transaction::remove_op& x) {
      auto& xs = lists_[x.list];
      if (auto i = std::find(xs.begin(), xs.end(), x.value); i != xs.end())
        xs.erase(i);
    },
    [this](const transaction::set_field_op& x) {
      hashes_[x.hash][x.field] = x.value;
    },
    [this](const transaction::erase_field_op& x) {
      if (auto i = hashes_.find(x.hash); i != hashes_.end())
        i->second.erase(x.field);
    },
    [this](const transaction::increment_op& x) { ++counters_[x.counter]; },
  };
  std::visit(f, op);
  bump(key_of(op));
}

void memory_backend::bump(const std::string& key) {
  ++versions_[key];
}

} // namespace sortfeed::detail
