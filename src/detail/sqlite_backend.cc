#include "sortfeed/detail/sqlite_backend.hh"

#include "sortfeed/config.hh"
#include "sortfeed/detail/filesystem.hh"
#include "sortfeed/detail/overload.hh"
#include "sortfeed/detail/transaction.hh"
#include "sortfeed/error.hh"
#include "sortfeed/internal/logger.hh"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <caf/detail/scope_guard.hpp>

#include <sqlite3.h>

namespace sortfeed::detail {

namespace {

auto make_statement_guard = [](sqlite3_stmt* stmt) {
  return caf::detail::make_scope_guard([=] {
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
  });
};

bool bind_text(sqlite3_stmt* stmt, int index, const std::string& str) {
  return sqlite3_bind_text(stmt, index, str.data(),
                           static_cast<int>(str.size()), SQLITE_STATIC)
         == SQLITE_OK;
}

bool bind_blob(sqlite3_stmt* stmt, int index, const std::string& str) {
  return sqlite3_bind_blob64(stmt, index, str.data(), str.size(),
                             SQLITE_STATIC)
         == SQLITE_OK;
}

std::string column_blob(sqlite3_stmt* stmt, int index) {
  auto ptr = static_cast<const char*>(sqlite3_column_blob(stmt, index));
  auto size = sqlite3_column_bytes(stmt, index);
  if (ptr == nullptr || size <= 0)
    return {};
  return std::string{ptr, static_cast<size_t>(size)};
}

std::string column_text(sqlite3_stmt* stmt, int index) {
  auto ptr = sqlite3_column_text(stmt, index);
  auto size = sqlite3_column_bytes(stmt, index);
  if (ptr == nullptr || size <= 0)
    return {};
  return std::string{reinterpret_cast<const char*>(ptr),
                     static_cast<size_t>(size)};
}

// Find name in options and verify that its (upper case) value is one of the
// allowed values. Missing options are no error.
bool extract_optional_enum_option(const backend_options& options,
                                  const std::string& name,
                                  std::initializer_list<std::string_view> allowed,
                                  std::string& result) {
  auto i = options.find(name);
  if (i == options.end())
    return true;
  auto value = i->second;
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) { return std::toupper(ch); });
  if (std::find(allowed.begin(), allowed.end(), value) == allowed.end()) {
    internal::log::store::error("sqlite-invalid-option",
                                "SQLite backend option {} has an invalid "
                                "value: {}",
                                name, i->second);
    return false;
  }
  result = std::move(value);
  return true;
}

} // namespace

struct sqlite_backend::impl {
  explicit impl(backend_options opts) : options{std::move(opts)} {
    if (!extract_optional_enum_option(options, "synchronous",
                                      {"OFF", "NORMAL", "FULL", "EXTRA"},
                                      pragma_synchronous))
      return;
    if (!extract_optional_enum_option(options, "journal_mode",
                                      {"DELETE", "WAL"}, pragma_journal_mode))
      return;
    std::string failure_mode;
    if (!extract_optional_enum_option(options, "failure_mode",
                                      {"DELETE", "FAIL"}, failure_mode))
      return;
    delete_corrupt = failure_mode == "DELETE";
    if (auto i = options.find("integrity_check"); i != options.end()) {
      if (i->second == "true") {
        integrity_check = true;
      } else if (i->second != "false") {
        internal::log::store::error("sqlite-invalid-option",
                                    "SQLite backend option integrity_check "
                                    "not a boolean: {}",
                                    i->second);
        return;
      }
    }
    if (auto i = options.find("busy_timeout"); i != options.end()) {
      try {
        busy_timeout = std::stoi(i->second);
      } catch (const std::exception&) {
        internal::log::store::error("sqlite-invalid-option",
                                    "SQLite backend option busy_timeout not "
                                    "an integer: {}",
                                    i->second);
        return;
      }
    }
    auto i = options.find("path");
    if (i == options.end()) {
      internal::log::store::error("sqlite-missing-path",
                                  "SQLite backend options are missing "
                                  "required path");
      return;
    }
    if (!open(i->second))
      internal::log::store::error("sqlite-open-failed",
                                  "unable to open SQLite database {}",
                                  i->second);
  }

  ~impl() {
    close();
  }

  void close() {
    if (!db)
      return;
    for (auto stmt : finalize)
      sqlite3_finalize(stmt);
    finalize.clear();
    sqlite3_close(db);
    db = nullptr;
  }

  // Run PRAGMA command with an optional value.
  //
  // Assumes name and value have been verified previously and are safe
  // to be formatted into SQL.
  bool exec_pragma(std::string_view name, std::string_view value,
                   std::vector<std::string>* messages = nullptr) {
    auto query = std::string{"PRAGMA "};
    query += name;
    if (!value.empty()) {
      query += '=';
      query += value;
    }
    auto cb = [](void* arg, int argc, char** argv, char**) {
      auto messages = static_cast<std::vector<std::string>*>(arg);
      if (messages && argc > 0 && argv[0] != nullptr)
        messages->push_back(argv[0]);
      return 0;
    };
    auto result = sqlite3_exec(db, query.c_str(), cb, messages, nullptr);
    if (result != SQLITE_OK) {
      internal::log::store::error("sqlite-pragma-failed",
                                  "failed to run {}: {}", query,
                                  sqlite3_errmsg(db));
      close();
      return false;
    }
    return true;
  }

  // Run PRAGMA integrity_check and verify the output is just "ok".
  bool run_integrity_check() {
    std::vector<std::string> messages;
    if (!exec_pragma("integrity_check", "", &messages))
      return false;
    if (messages.size() != 1 || messages[0] != "ok") {
      internal::log::store::error("sqlite-integrity-check-failed",
                                  "PRAGMA integrity_check returned {} "
                                  "messages",
                                  messages.size());
      for (const auto& msg : messages)
        internal::log::store::error("sqlite-integrity-check-failed",
                                    "PRAGMA integrity_check: {}", msg);
      close();
      return false;
    }
    return true;
  }

  bool exec(const char* sql) {
    if (sqlite3_exec(db, sql, nullptr, nullptr, nullptr) != SQLITE_OK) {
      internal::log::store::error("sqlite-exec-failed",
                                  "failed to run {}: {}", sql,
                                  sqlite3_errmsg(db));
      return false;
    }
    return true;
  }

  // Initialize the database handle and populate with tables.
  bool initialize_db(const std::string& path) {
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
      internal::log::store::error("sqlite-open-failed",
                                  "failed to open database {}: {}", path,
                                  sqlite3_errmsg(db));
      sqlite3_close(db);
      db = nullptr;
      return false;
    }
    sqlite3_busy_timeout(db, busy_timeout);
    if (!pragma_synchronous.empty()
        && !exec_pragma("synchronous", pragma_synchronous))
      return false;
    if (!pragma_journal_mode.empty()
        && !exec_pragma("journal_mode", pragma_journal_mode))
      return false;
    const char* tables[] = {
      "create table if not exists meta(key text primary key, value text);",
      "create table if not exists counters"
      "(key text primary key, value integer not null);",
      "create table if not exists versions"
      "(key text primary key, version integer not null);",
      "create table if not exists lists"
      "(key text not null, pos integer not null, value blob not null);",
      "create index if not exists lists_by_pos on lists(key, pos);",
      "create table if not exists hashes"
      "(key text not null, field text not null, value blob not null,"
      " primary key(key, field));",
    };
    for (auto sql : tables) {
      if (!exec(sql)) {
        close();
        return false;
      }
    }
    char tmp[128];
    std::snprintf(tmp, sizeof(tmp),
                  "replace into meta(key, value) "
                  "values('sortfeed_version', '%d.%d.%d');",
                  SORTFEED_VERSION_MAJOR, SORTFEED_VERSION_MINOR,
                  SORTFEED_VERSION_PATCH);
    if (!exec(tmp)) {
      close();
      return false;
    }
    if (integrity_check) {
      internal::log::store::info("sqlite-integrity-check",
                                 "running integrity check for database {}",
                                 path);
      if (!run_integrity_check())
        return false;
    }
    return true;
  }

  bool open(const std::string& path) {
    auto dir = detail::dirname(path);
    if (!dir.empty() && !detail::is_directory(dir) && !detail::mkdirs(dir)) {
      internal::log::store::error("sqlite-mkdir-failed",
                                  "failed to create directory for database: "
                                  "{}",
                                  dir.string());
      return false;
    }
    // Attempt to initialize the database. If we find it corrupt and
    // failure_mode is "DELETE", attempt to delete the file and do it again.
    if (!initialize_db(path)) {
      if (!delete_corrupt || !detail::exists(path))
        return false;
      if (!detail::is_file(path)) {
        internal::log::store::error("sqlite-not-a-file",
                                    "database path is not a file: {}", path);
        return false;
      }
      internal::log::store::warning("sqlite-delete-corrupt",
                                    "attempting to delete corrupt database {}",
                                    path);
      if (!detail::remove(path))
        return false;
      if (!initialize_db(path)) {
        internal::log::store::error("sqlite-init-failed",
                                    "failed to initialize database after "
                                    "deletion");
        return false;
      }
    }
    std::vector<std::pair<sqlite3_stmt**, const char*>> statements{
      {&begin, "begin immediate;"},
      {&commit, "commit;"},
      {&rollback, "rollback;"},
      {&counter_get, "select value from counters where key = ?;"},
      {&counter_add, "insert or ignore into counters(key, value) "
                     "values(?, 0);"},
      {&counter_inc, "update counters set value = value + 1 where key = ?;"},
      {&version_get, "select version from versions where key = ?;"},
      {&version_add, "insert or ignore into versions(key, version) "
                     "values(?, 0);"},
      {&version_inc, "update versions set version = version + 1 "
                     "where key = ?;"},
      {&list_range, "select value from lists where key = ? order by pos;"},
      {&list_bounds, "select min(pos), max(pos) from lists where key = ?;"},
      {&list_find, "select pos from lists where key = ? and value = ? "
                   "order by pos limit 1;"},
      {&list_shift, "update lists set pos = pos + 1 "
                    "where key = ? and pos >= ?;"},
      {&list_put, "insert into lists(key, pos, value) values(?, ?, ?);"},
      {&list_erase, "delete from lists where rowid = (select rowid from lists "
                    "where key = ? and pos = ? limit 1);"},
      {&hash_get, "select value from hashes where key = ? and field = ?;"},
      {&hash_exists, "select 1 from hashes where key = ? and field = ?;"},
      {&hash_all, "select field, value from hashes where key = ?;"},
      {&hash_put, "replace into hashes(key, field, value) values(?, ?, ?);"},
      {&hash_erase, "delete from hashes where key = ? and field = ?;"},
    };
    auto prepare = [&](sqlite3_stmt** stmt, const char* sql) {
      if (sqlite3_prepare_v2(db, sql, -1, stmt, nullptr) != SQLITE_OK)
        return false;
      finalize.push_back(*stmt);
      return true;
    };
    for (auto& stmt : statements)
      if (!prepare(stmt.first, stmt.second)) {
        internal::log::store::error("sqlite-prepare-failed",
                                    "failed to prepare statement {}: {}",
                                    stmt.second, sqlite3_errmsg(db));
        close();
        return false;
      }
    return true;
  }

  // -- utility ----------------------------------------------------------------

  bool step_done(sqlite3_stmt* stmt) {
    auto guard = make_statement_guard(stmt);
    if (sqlite3_step(stmt) != SQLITE_DONE) {
      internal::log::store::error("sqlite-step-failed",
                                  "failed to run statement {}: {}",
                                  sqlite3_sql(stmt), sqlite3_errmsg(db));
      return false;
    }
    return true;
  }

  bool step_done(sqlite3_stmt* stmt, const std::string& key) {
    if (!bind_text(stmt, 1, key)) {
      sqlite3_clear_bindings(stmt);
      return false;
    }
    return step_done(stmt);
  }

  /// Reads an integer from the first column of the first row or returns
  /// `fallback` if the query yields no rows.
  expected<int64_t> query_int(sqlite3_stmt* stmt, const std::string& key,
                              int64_t fallback) {
    auto guard = make_statement_guard(stmt);
    if (!bind_text(stmt, 1, key))
      return ec::backend_failure;
    switch (sqlite3_step(stmt)) {
      case SQLITE_ROW:
        return sqlite3_column_int64(stmt, 0);
      case SQLITE_DONE:
        return fallback;
      default:
        internal::log::store::error("sqlite-step-failed",
                                    "failed to run statement {}: {}",
                                    sqlite3_sql(stmt), sqlite3_errmsg(db));
        return ec::backend_failure;
    }
  }

  bool bump(const std::string& key) {
    return step_done(version_add, key) && step_done(version_inc, key);
  }

  bool increment_counter(const std::string& key) {
    return step_done(counter_add, key) && step_done(counter_inc, key);
  }

  /// Returns the position of the first occurrence of `value` in `key`.
  expected<std::optional<int64_t>> find(const std::string& key,
                                        const std::string& value) {
    auto guard = make_statement_guard(list_find);
    if (!bind_text(list_find, 1, key) || !bind_blob(list_find, 2, value))
      return ec::backend_failure;
    switch (sqlite3_step(list_find)) {
      case SQLITE_ROW:
        return std::optional<int64_t>{sqlite3_column_int64(list_find, 0)};
      case SQLITE_DONE:
        return std::optional<int64_t>{};
      default:
        return ec::backend_failure;
    }
  }

  /// Returns the lowest and highest position in `key` or `nullopt` if the list
  /// is empty.
  expected<std::optional<std::pair<int64_t, int64_t>>>
  bounds(const std::string& key) {
    using result_type = std::optional<std::pair<int64_t, int64_t>>;
    auto guard = make_statement_guard(list_bounds);
    if (!bind_text(list_bounds, 1, key))
      return ec::backend_failure;
    if (sqlite3_step(list_bounds) != SQLITE_ROW)
      return ec::backend_failure;
    if (sqlite3_column_type(list_bounds, 0) == SQLITE_NULL)
      return result_type{};
    return result_type{std::make_pair(sqlite3_column_int64(list_bounds, 0),
                                      sqlite3_column_int64(list_bounds, 1))};
  }

  bool put_at(const std::string& key, int64_t pos, const std::string& value) {
    auto guard = make_statement_guard(list_put);
    if (!bind_text(list_put, 1, key)
        || sqlite3_bind_int64(list_put, 2, pos) != SQLITE_OK
        || !bind_blob(list_put, 3, value))
      return false;
    return sqlite3_step(list_put) == SQLITE_DONE;
  }

  bool shift_from(const std::string& key, int64_t pos) {
    auto guard = make_statement_guard(list_shift);
    if (!bind_text(list_shift, 1, key)
        || sqlite3_bind_int64(list_shift, 2, pos) != SQLITE_OK)
      return false;
    return sqlite3_step(list_shift) == SQLITE_DONE;
  }

  bool erase_at(const std::string& key, int64_t pos) {
    auto guard = make_statement_guard(list_erase);
    if (!bind_text(list_erase, 1, key)
        || sqlite3_bind_int64(list_erase, 2, pos) != SQLITE_OK)
      return false;
    return sqlite3_step(list_erase) == SQLITE_DONE;
  }

  bool push(const std::string& key, const std::string& value, bool front) {
    auto bs = bounds(key);
    if (!bs)
      return false;
    int64_t pos = 0;
    if (*bs)
      pos = front ? (*bs)->first - 1 : (*bs)->second + 1;
    return put_at(key, pos, value);
  }

  bool insert(const transaction::insert_op& op) {
    auto pivot = find(op.list, op.pivot);
    if (!pivot)
      return false;
    if (!*pivot)
      return true;
    auto pos = **pivot;
    if (op.position == insert_position::after)
      ++pos;
    return shift_from(op.list, pos) && put_at(op.list, pos, op.value);
  }

  bool remove(const transaction::remove_op& op) {
    auto pos = find(op.list, op.value);
    if (!pos)
      return false;
    if (!*pos)
      return true;
    return erase_at(op.list, **pos);
  }

  bool set_field(const transaction::set_field_op& op) {
    auto guard = make_statement_guard(hash_put);
    if (!bind_text(hash_put, 1, op.hash) || !bind_text(hash_put, 2, op.field)
        || !bind_blob(hash_put, 3, op.value))
      return false;
    return sqlite3_step(hash_put) == SQLITE_DONE;
  }

  bool erase_field(const transaction::erase_field_op& op) {
    auto guard = make_statement_guard(hash_erase);
    if (!bind_text(hash_erase, 1, op.hash)
        || !bind_text(hash_erase, 2, op.field))
      return false;
    return sqlite3_step(hash_erase) == SQLITE_DONE;
  }

  bool apply(const transaction::operation& op) {
    auto f = overload{
      [this](const transaction::push_back_op& x) {
        return push(x.list, x.value, false);
      },
      [this](const transaction::push_front_op& x) {
        return push(x.list, x.value, true);
      },
      [this](const transaction::insert_op& x) { return insert(x); },
      [this](const transaction::remove_op& x) { return remove(x); },
      [this](const transaction::set_field_op& x) { return set_field(x); },
      [this](const transaction::erase_field_op& x) { return erase_field(x); },
      [this](const transaction::increment_op& x) {
        return increment_counter(x.counter);
      },
    };
    return std::visit(f, op) && bump(key_of(op));
  }

  /// Runs `body` inside `BEGIN IMMEDIATE` and commits if it returns `true`.
  /// Rolls back otherwise.
  template <class F>
  auto with_write_lock(F body) -> decltype(body()) {
    if (!step_done(begin))
      return ec::backend_failure;
    auto res = body();
    if (!res || !*res) {
      if (!step_done(rollback))
        internal::log::store::error("sqlite-rollback-failed",
                                    "failed to roll back transaction");
      return res;
    }
    if (!step_done(commit)) {
      if (!step_done(rollback))
        internal::log::store::error("sqlite-rollback-failed",
                                    "failed to roll back transaction");
      return ec::backend_failure;
    }
    return res;
  }

  backend_options options;
  sqlite3* db = nullptr;
  std::mutex mtx;
  sqlite3_stmt* begin = nullptr;
  sqlite3_stmt* commit = nullptr;
  sqlite3_stmt* rollback = nullptr;
  sqlite3_stmt* counter_get = nullptr;
  sqlite3_stmt* counter_add = nullptr;
  sqlite3_stmt* counter_inc = nullptr;
  sqlite3_stmt* version_get = nullptr;
  sqlite3_stmt* version_add = nullptr;
  sqlite3_stmt* version_inc = nullptr;
  sqlite3_stmt* list_range = nullptr;
  sqlite3_stmt* list_bounds = nullptr;
  sqlite3_stmt* list_find = nullptr;
  sqlite3_stmt* list_shift = nullptr;
  sqlite3_stmt* list_put = nullptr;
  sqlite3_stmt* list_erase = nullptr;
  sqlite3_stmt* hash_get = nullptr;
  sqlite3_stmt* hash_exists = nullptr;
  sqlite3_stmt* hash_all = nullptr;
  sqlite3_stmt* hash_put = nullptr;
  sqlite3_stmt* hash_erase = nullptr;
  std::vector<sqlite3_stmt*> finalize;
  std::string pragma_synchronous;
  std::string pragma_journal_mode;
  int busy_timeout = 5000;
  bool delete_corrupt = false;
  bool integrity_check = false;
};

sqlite_backend::sqlite_backend(backend_options opts)
  : impl_{std::make_unique<impl>(std::move(opts))} {}

sqlite_backend::~sqlite_backend() {}

bool sqlite_backend::init_failed() const {
  return !impl_->db;
}

bool sqlite_backend::exec_pragma(std::string_view name, std::string_view value,
                                 std::vector<std::string>* messages) {
  std::lock_guard<std::mutex> guard{impl_->mtx};
  if (!impl_->db)
    return false;
  return impl_->exec_pragma(name, value, messages);
}

expected<uint64_t> sqlite_backend::increment(const std::string& key) {
  std::lock_guard<std::mutex> guard{impl_->mtx};
  if (!impl_->db)
    return ec::backend_failure;
  auto result = uint64_t{0};
  auto res = impl_->with_write_lock([&]() -> expected<bool> {
    if (!impl_->increment_counter(key) || !impl_->bump(key))
      return ec::backend_failure;
    auto val = impl_->query_int(impl_->counter_get, key, 0);
    if (!val)
      return val.error();
    result = static_cast<uint64_t>(*val);
    return true;
  });
  if (!res)
    return res.error();
  return result;
}

expected<bool> sqlite_backend::commit(const transaction& tx) {
  std::lock_guard<std::mutex> guard{impl_->mtx};
  if (!impl_->db)
    return ec::backend_failure;
  auto res = impl_->with_write_lock([&]() -> expected<bool> {
    for (const auto& [key, version] : tx.watches()) {
      auto current = impl_->query_int(impl_->version_get, key, 0);
      if (!current)
        return current.error();
      if (static_cast<version_type>(*current) != version) {
        internal::log::store::debug("commit-conflict",
                                    "key {} changed from version {} to {}",
                                    key, version, *current);
        return false;
      }
    }
    for (const auto& op : tx.operations()) {
      if (!impl_->apply(op)) {
        internal::log::store::error("sqlite-apply-failed",
                                    "failed to apply {}: {}", to_string(op),
                                    sqlite3_errmsg(impl_->db));
        return ec::backend_failure;
      }
    }
    return true;
  });
  // Other connections may commit as soon as COMMIT releases the write lock,
  // but this connection stays locked until its events are out.
  if (res && *res)
    tx.deliver();
  return res;
}

expected<uint64_t> sqlite_backend::counter(const std::string& key) const {
  std::lock_guard<std::mutex> guard{impl_->mtx};
  if (!impl_->db)
    return ec::backend_failure;
  auto res = impl_->query_int(impl_->counter_get, key, 0);
  if (!res)
    return res.error();
  return static_cast<uint64_t>(*res);
}

expected<std::vector<std::string>>
sqlite_backend::range(const std::string& key) const {
  std::lock_guard<std::mutex> guard{impl_->mtx};
  if (!impl_->db)
    return ec::backend_failure;
  auto stmt = impl_->list_range;
  auto guard2 = make_statement_guard(stmt);
  if (!bind_text(stmt, 1, key))
    return ec::backend_failure;
  std::vector<std::string> result;
  auto rc = SQLITE_DONE;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
    result.emplace_back(column_blob(stmt, 0));
  if (rc != SQLITE_DONE)
    return ec::backend_failure;
  return result;
}

expected<std::string> sqlite_backend::field(const std::string& key,
                                            const std::string& name) const {
  std::lock_guard<std::mutex> guard{impl_->mtx};
  if (!impl_->db)
    return ec::backend_failure;
  auto stmt = impl_->hash_get;
  auto guard2 = make_statement_guard(stmt);
  if (!bind_text(stmt, 1, key) || !bind_text(stmt, 2, name))
    return ec::backend_failure;
  switch (sqlite3_step(stmt)) {
    case SQLITE_ROW:
      return column_blob(stmt, 0);
    case SQLITE_DONE:
      return ec::no_such_key;
    default:
      return ec::backend_failure;
  }
}

expected<bool> sqlite_backend::has_field(const std::string& key,
                                         const std::string& name) const {
  std::lock_guard<std::mutex> guard{impl_->mtx};
  if (!impl_->db)
    return ec::backend_failure;
  auto stmt = impl_->hash_exists;
  auto guard2 = make_statement_guard(stmt);
  if (!bind_text(stmt, 1, key) || !bind_text(stmt, 2, name))
    return ec::backend_failure;
  switch (sqlite3_step(stmt)) {
    case SQLITE_ROW:
      return true;
    case SQLITE_DONE:
      return false;
    default:
      return ec::backend_failure;
  }
}

expected<std::map<std::string, std::string>>
sqlite_backend::fields(const std::string& key) const {
  std::lock_guard<std::mutex> guard{impl_->mtx};
  if (!impl_->db)
    return ec::backend_failure;
  auto stmt = impl_->hash_all;
  auto guard2 = make_statement_guard(stmt);
  if (!bind_text(stmt, 1, key))
    return ec::backend_failure;
  std::map<std::string, std::string> result;
  auto rc = SQLITE_DONE;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
    result.emplace(column_text(stmt, 0), column_blob(stmt, 1));
  if (rc != SQLITE_DONE)
    return ec::backend_failure;
  return result;
}

expected<version_type> sqlite_backend::watch(const std::string& key) const {
  std::lock_guard<std::mutex> guard{impl_->mtx};
  if (!impl_->db)
    return ec::backend_failure;
  auto res = impl_->query_int(impl_->version_get, key, 0);
  if (!res)
    return res.error();
  return static_cast<version_type>(*res);
}

} // namespace sortfeed::detail
