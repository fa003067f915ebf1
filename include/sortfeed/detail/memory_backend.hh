#pragma once

#include "sortfeed/detail/abstract_backend.hh"
#include "sortfeed/detail/transaction.hh"

#include <deque>
#include <mutex>
#include <unordered_map>

namespace sortfeed::detail {

/// An in-memory storage backend. A single mutex serializes all operations, so
/// one instance may be shared by any number of threads. Events queued on a
/// transaction go out while the mutex is held.
class memory_backend : public abstract_backend {
public:
  expected<uint64_t> increment(const std::string& key) override;

  expected<bool> commit(const transaction& tx) override;

  expected<uint64_t> counter(const std::string& key) const override;

  expected<std::vector<std::string>>
  range(const std::string& key) const override;

  expected<std::string> field(const std::string& key,
                              const std::string& name) const override;

  expected<bool> has_field(const std::string& key,
                           const std::string& name) const override;

  expected<std::map<std::string, std::string>>
  fields(const std::string& key) const override;

  expected<version_type> watch(const std::string& key) const override;

private:
  void apply(const transaction::operation& op);

  void bump(const std::string& key);

  mutable std::mutex mtx_;
  std::unordered_map<std::string, uint64_t> counters_;
  std::unordered_map<std::string, std::deque<std::string>> lists_;
  std::unordered_map<std::string, std::map<std::string, std::string>> hashes_;
  std::unordered_map<std::string, version_type> versions_;
};

} // namespace sortfeed::detail
