#pragma once

#include "sortfeed/detail/abstract_backend.hh"
#include "sortfeed/expected.hh"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sortfeed::detail {

/// A SQLite storage backend. Several instances, possibly in different
/// processes, may open the same database file and share its contents. Events
/// queued on a transaction go out in the commit order of this connection.
class sqlite_backend : public abstract_backend {
public:
  /// Constructs a SQLite backend.
  /// @param opts The options to create/open a database.
  /// Required parameters:
  ///   - `path`: the location of the database on the filesystem.
  /// Optional parameters:
  ///   - `synchronous`: value for PRAGMA synchronous, one of `OFF`, `NORMAL`,
  ///                    `FULL` or `EXTRA`.
  ///   - `journal_mode`: value for PRAGMA journal_mode, `DELETE` or `WAL`.
  ///   - `busy_timeout`: milliseconds to wait on a locked database.
  ///   - `integrity_check`: `true` runs PRAGMA integrity_check during
  ///                        initialization.
  explicit sqlite_backend(backend_options opts = backend_options{});

  ~sqlite_backend() override;

  bool init_failed() const;

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

  /// Run PRAGMA command with an optional value.
  /// @param name The name of the PRAGMA to run.
  /// @param value An optional value for the PRAGMA.
  /// @param messages Pointer to vector for collecting the output.
  /// @returns True on success, false on error.
  bool exec_pragma(std::string_view name,
                   std::string_view value = std::string_view{},
                   std::vector<std::string>* messages = nullptr);

private:
  struct impl;
  std::unique_ptr<impl> impl_;
};

} // namespace sortfeed::detail
