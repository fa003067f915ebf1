#include "sortfeed/configuration.hh"

#include "sortfeed/event.hh"
#include "sortfeed/internal/type_id.hh"
#include "sortfeed/logger.hh"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <iterator>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <caf/actor_system_config.hpp>
#include <caf/init_global_meta_objects.hpp>
#include <caf/settings.hpp>

namespace sortfeed {

namespace {

template <class... Ts>
auto concat(Ts... xs) {
  std::string result;
  ((result += xs), ...);
  return result;
}

bool valid_log_level(std::string_view x) {
  event::severity_level dummy;
  return x == "quiet" || convert(x, dummy);
}

[[noreturn]] void throw_illegal_log_level(const char* var,
                                          std::string_view str) {
  auto what = concat("illegal value for ", var, ": '", std::string{str},
                     "' (legal values: 'quiet', 'critical', 'error', "
                     "'warning', 'info', 'debug')");
  throw std::invalid_argument(what);
}

[[noreturn]] void throw_illegal_backend(const char* var, std::string_view str) {
  auto what = concat("illegal value for ", var, ": '", std::string{str},
                     "' (legal values: 'memory', 'sqlite')");
  throw std::invalid_argument(what);
}

} // namespace

struct configuration::impl : public caf::actor_system_config {
  using super = caf::actor_system_config;

  impl() {
    using std::string;
    // Add custom options to the CAF parser.
    opt_group{custom_options_, "?sortfeed"}
      .add<string>("backend", "storage backend: 'memory' or 'sqlite'")
      .add<string>("path", "database file of the sqlite backend")
      .add<string>("console-verbosity",
                   "minimum severity for console output or 'quiet'");
    opt_group{custom_options_, "sortfeed.sqlite"}
      .add<string>("synchronous", "PRAGMA synchronous: OFF|NORMAL|FULL|EXTRA")
      .add<string>("journal-mode", "PRAGMA journal_mode: DELETE|WAL")
      .add<int64_t>("busy-timeout",
                    "milliseconds to wait for a locked database")
      .add<bool>("integrity-check", "runs PRAGMA integrity_check on startup")
      .add<string>("failure-mode",
                   "DELETE recreates a database that fails to open, FAIL "
                   "gives up");
    opt_group{custom_options_, "sortfeed.retry"}
      .add<caf::timespan>("initial-backoff", "delay before the first retry")
      .add<caf::timespan>("max-backoff", "maximum delay between attempts")
      .add<double>("factor", "growth factor of the delay per conflict")
      .add<bool>("jitter", "randomizes the delay between attempts")
      .add<size_t>("max-attempts",
                   "maximum attempts per operation (0 = unbounded)")
      .add<caf::timespan>("timeout",
                          "maximum time per operation (default: infinite)");
    config_file_path = "sortfeed.conf";
  }

  void init(int argc, char** argv);

  void validate();
};

configuration::configuration(skip_init_t) {
  init_global_state();
  impl_ = std::make_unique<impl>();
}

configuration::configuration() : configuration(skip_init) {
  init(0, nullptr);
}

configuration::configuration(configuration&& other) noexcept
  : impl_(std::move(other.impl_)) {
  // cannot '= default' this because impl is incomplete in the header.
}

configuration::configuration(int argc, char** argv) : configuration(skip_init) {
  init(argc, argv);
}

configuration::~configuration() {
  // nop, but must stay out-of-line because impl is incomplete in the header.
}

void configuration::impl::init(int argc, char** argv) {
  std::vector<std::string> args;
  if (argc > 1 && argv != nullptr)
    args.assign(argv + 1, argv + argc);
  // Phase 1: parse sortfeed.conf or configuration file specified by the user
  //          on the command line (overrides hard-coded defaults).
  std::vector<std::string> args_subset;
  auto predicate = [](const std::string& str) {
    return str.compare(0, 14, "--config-file=") != 0;
  };
  auto sep = std::stable_partition(args.begin(), args.end(), predicate);
  if (sep != args.end()) {
    args_subset.assign(std::make_move_iterator(sep),
                       std::make_move_iterator(args.end()));
    args.erase(sep, args.end());
  }
  if (auto err = parse(std::move(args_subset))) {
    auto what = concat("Error while reading configuration file: ",
                       caf::to_string(err));
    throw std::runtime_error(what);
  }
  // Phase 2: parse environment variables (override config file settings).
  if (auto env = getenv("SORTFEED_CONSOLE_VERBOSITY")) {
    if (!valid_log_level(env))
      throw_illegal_log_level("SORTFEED_CONSOLE_VERBOSITY", env);
    set("sortfeed.console-verbosity", std::string{env});
  }
  if (auto env = getenv("SORTFEED_BACKEND")) {
    backend tmp;
    if (!convert(std::string_view{env}, tmp))
      throw_illegal_backend("SORTFEED_BACKEND", env);
    set("sortfeed.backend", std::string{env});
  }
  if (auto env = getenv("SORTFEED_PATH")) {
    set("sortfeed.path", std::string{env});
  }
  if (auto env = getenv("SORTFEED_RETRY_MAX_ATTEMPTS")) {
    char* end = nullptr;
    errno = 0;
    auto value = strtol(env, &end, 10);
    if (errno == ERANGE || *end != '\0' || value < 0) {
      auto what = concat("invalid value for SORTFEED_RETRY_MAX_ATTEMPTS: ",
                         env, " (expected a non-negative integer)");
      throw std::invalid_argument(what);
    }
    set("sortfeed.retry.max-attempts", static_cast<int64_t>(value));
  }
  // Phase 3: parse command line arguments.
  if (!args.empty()) {
    std::stringstream dummy;
    if (auto err = parse(std::move(args), dummy)) {
      auto what = concat("Error while parsing CLI arguments: ",
                         caf::to_string(err));
      throw std::runtime_error(what);
    }
  }
  validate();
}

void configuration::impl::validate() {
  if (auto str = caf::get_as<std::string>(content, "sortfeed.backend")) {
    backend tmp;
    if (!convert(std::string_view{*str}, tmp))
      throw_illegal_backend("sortfeed.backend", *str);
  }
  if (auto str = caf::get_as<std::string>(content,
                                          "sortfeed.console-verbosity")) {
    if (!valid_log_level(*str))
      throw_illegal_log_level("sortfeed.console-verbosity", *str);
  }
}

void configuration::init(int argc, char** argv) {
  impl_->init(argc, argv);
}

std::string configuration::help_text() const {
  return impl_->custom_options().help_text();
}

const std::vector<std::string>& configuration::remainder() const {
  return impl_->remainder;
}

bool configuration::cli_helptext_printed() const {
  return impl_->cli_helptext_printed;
}

retry_options configuration::retry() const {
  retry_options result;
  if (auto val = read_ts("sortfeed.retry.initial-backoff"))
    result.initial_backoff = *val;
  if (auto val = read_ts("sortfeed.retry.max-backoff"))
    result.max_backoff = *val;
  if (auto val = read_double("sortfeed.retry.factor"))
    result.factor = *val;
  if (auto val = read_bool("sortfeed.retry.jitter"))
    result.jitter = *val;
  if (auto val = get_as<size_t>(*this, "sortfeed.retry.max-attempts"))
    result.max_attempts = *val;
  if (auto val = read_ts("sortfeed.retry.timeout"))
    result.timeout = *val;
  return result;
}

backend configuration::backend_type() const {
  auto result = backend::memory;
  if (auto str = read_str("sortfeed.backend"))
    std::ignore = convert(std::string_view{*str}, result);
  return result;
}

sortfeed::backend_options configuration::backend_options() const {
  sortfeed::backend_options result;
  if (auto str = read_str("sortfeed.path"))
    result.emplace("path", std::move(*str));
  if (auto str = read_str("sortfeed.sqlite.synchronous"))
    result.emplace("synchronous", std::move(*str));
  if (auto str = read_str("sortfeed.sqlite.journal-mode"))
    result.emplace("journal_mode", std::move(*str));
  if (auto val = read_i64("sortfeed.sqlite.busy-timeout", 0,
                          std::numeric_limits<int32_t>::max()))
    result.emplace("busy_timeout", std::to_string(*val));
  if (auto val = read_bool("sortfeed.sqlite.integrity-check"))
    result.emplace("integrity_check", *val ? "true" : "false");
  if (auto str = read_str("sortfeed.sqlite.failure-mode"))
    result.emplace("failure_mode", std::move(*str));
  return result;
}

std::string configuration::console_verbosity() const {
  if (auto str = read_str("sortfeed.console-verbosity"))
    return std::move(*str);
  return "error";
}

void configuration::init_logger() const {
  if (auto verbosity = console_verbosity(); verbosity != "quiet")
    set_console_logger(verbosity);
}

void configuration::add_option(int64_t* dst, std::string_view name,
                               std::string_view description) {
  if (dst)
    impl_->custom_options().add(*dst, "global", name, description);
  else
    impl_->custom_options().add<int64_t>("global", name, description);
}

void configuration::add_option(uint64_t* dst, std::string_view name,
                               std::string_view description) {
  if (dst)
    impl_->custom_options().add(*dst, "global", name, description);
  else
    impl_->custom_options().add<uint64_t>("global", name, description);
}

void configuration::add_option(bool* dst, std::string_view name,
                               std::string_view description) {
  if (dst)
    impl_->custom_options().add(*dst, "global", name, description);
  else
    impl_->custom_options().add<bool>("global", name, description);
}

void configuration::add_option(std::string* dst, std::string_view name,
                               std::string_view description) {
  if (dst)
    impl_->custom_options().add(*dst, "global", name, description);
  else
    impl_->custom_options().add<std::string>("global", name, description);
}

void configuration::set(std::string_view key, double val) {
  impl_->set(key, val);
}

void configuration::set(std::string_view key, timespan val) {
  impl_->set(key, val);
}

void configuration::set(std::string_view key, std::string val) {
  impl_->set(key, std::move(val));
}

void configuration::set_i64(std::string_view key, int64_t val) {
  impl_->set(key, val);
}

void configuration::set_u64(std::string_view key, uint64_t val) {
  impl_->set(key, static_cast<int64_t>(val));
}

void configuration::set_bool(std::string_view key, bool val) {
  impl_->set(key, val);
}

std::optional<int64_t> configuration::read_i64(std::string_view key,
                                               int64_t min_val,
                                               int64_t max_val) const {
  if (auto res = caf::get_as<int64_t>(*impl_, key);
      res && *res >= min_val && *res <= max_val)
    return {*res};
  return {};
}

std::optional<uint64_t> configuration::read_u64(std::string_view key,
                                                uint64_t max_val) const {
  if (auto res = caf::get_as<uint64_t>(*impl_, key); res && *res <= max_val)
    return {*res};
  return {};
}

std::optional<double> configuration::read_double(std::string_view key) const {
  if (auto res = caf::get_as<double>(*impl_, key))
    return {*res};
  return {};
}

std::optional<bool> configuration::read_bool(std::string_view key) const {
  if (auto res = caf::get_as<bool>(*impl_, key))
    return {*res};
  return {};
}

std::optional<timespan> configuration::read_ts(std::string_view key) const {
  if (auto res = caf::get_as<caf::timespan>(*impl_, key))
    return {*res};
  return {};
}

std::optional<std::string> configuration::read_str(std::string_view key) const {
  if (auto res = caf::get_as<std::string>(*impl_, key))
    return {std::move(*res)};
  return {};
}

configuration::impl* configuration::native_ptr() noexcept {
  return impl_.get();
}

const configuration::impl* configuration::native_ptr() const noexcept {
  return impl_.get();
}

namespace {

std::once_flag init_global_state_flag;

} // namespace

void configuration::init_global_state() {
  std::call_once(init_global_state_flag, [] {
    caf::init_global_meta_objects<caf::id_block::sortfeed>();
    caf::core::init_global_meta_objects();
  });
}

} // namespace sortfeed
