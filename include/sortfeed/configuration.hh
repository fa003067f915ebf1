#pragma once

#include "sortfeed/backend.hh"
#include "sortfeed/fwd.hh"
#include "sortfeed/retry_options.hh"
#include "sortfeed/time.hh"

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace sortfeed {

struct skip_init_t {};

constexpr skip_init_t skip_init = skip_init_t{};

/// Configures the backing store, the retry behavior and logging of sortfeed
/// applications.
///
/// The configuration draws user-provided options from three sources (in order):
/// 1. The file `sortfeed.conf` (or the file passed via `--config-file=`).
///    Contents of this file override hard-coded defaults.
/// 2. Environment variables. sortfeed currently recognizes the following
///    environment variables:
///    - `SORTFEED_CONSOLE_VERBOSITY`: overrides `sortfeed.console-verbosity`.
///      Valid values are `quiet`, `critical`, `error`, `warning`, `info` and
///      `debug`.
///    - `SORTFEED_BACKEND`: overrides `sortfeed.backend` (`memory` or
///      `sqlite`).
///    - `SORTFEED_PATH`: overrides `sortfeed.path`.
///    - `SORTFEED_RETRY_MAX_ATTEMPTS`: overrides
///      `sortfeed.retry.max-attempts`.
/// 3. Command line arguments (if provided).
class configuration {
public:
  // --- member types ----------------------------------------------------------

  struct impl;

  // --- construction and destruction ------------------------------------------

  /// Constructs the configuration without calling `init` implicitly. Requires
  /// the user to call `init` manually.
  explicit configuration(skip_init_t);

  configuration();

  configuration(configuration&&) noexcept;

  /// Constructs a configuration from command line arguments.
  /// @throws std::invalid_argument if an environment variable has an invalid
  ///         value.
  /// @throws std::runtime_error if parsing the configuration file or the
  ///         command line arguments fails.
  configuration(int argc, char** argv);

  ~configuration();

  // -- properties -------------------------------------------------------------

  std::string help_text() const;

  /// Returns all positional command line arguments.
  const std::vector<std::string>& remainder() const;

  bool cli_helptext_printed() const;

  /// Returns the configured retry bounds and delays.
  retry_options retry() const;

  /// Returns the configured backend type.
  backend backend_type() const;

  /// Returns the options for `detail::make_backend`.
  sortfeed::backend_options backend_options() const;

  /// Returns the configured console verbosity.
  std::string console_verbosity() const;

  /// Installs a console logger according to `console_verbosity()` unless the
  /// verbosity is `quiet`.
  void init_logger() const;

  // -- mutators ---------------------------------------------------------------

  void add_option(int64_t* dst, std::string_view name,
                  std::string_view description);

  void add_option(uint64_t* dst, std::string_view name,
                  std::string_view description);

  void add_option(bool* dst, std::string_view name,
                  std::string_view description);

  void add_option(std::string* dst, std::string_view name,
                  std::string_view description);

  template <class T>
  std::enable_if_t<std::is_integral_v<T>> set(std::string_view key, T val) {
    if constexpr (std::is_same_v<T, bool>)
      set_bool(key, val);
    else if constexpr (std::is_signed_v<T>)
      set_i64(key, val);
    else
      set_u64(key, val);
  }

  void set(std::string_view key, double val);

  void set(std::string_view key, timespan val);

  void set(std::string_view key, std::string val);

  std::optional<int64_t> read_i64(std::string_view key, int64_t min_val,
                                  int64_t max_val) const;

  std::optional<uint64_t> read_u64(std::string_view key,
                                   uint64_t max_val) const;

  std::optional<double> read_double(std::string_view key) const;

  std::optional<bool> read_bool(std::string_view key) const;

  std::optional<timespan> read_ts(std::string_view key) const;

  std::optional<std::string> read_str(std::string_view key) const;

  /// Initializes global state such as the meta object tables for sortfeed and
  /// CAF. This function is safe to call multiple times (repeated calls have no
  /// effect).
  /// @note all constructors call this function implicitly.
  static void init_global_state();

  /// Returns a pointer to the native representation.
  [[nodiscard]] impl* native_ptr() noexcept;

  /// Returns a pointer to the native representation.
  [[nodiscard]] const impl* native_ptr() const noexcept;

  void init(int argc, char** argv);

private:
  void set_i64(std::string_view key, int64_t val);

  void set_u64(std::string_view key, uint64_t val);

  void set_bool(std::string_view key, bool val);

  std::unique_ptr<impl> impl_;
};

template <class T>
auto get_as(const configuration& cfg, std::string_view key) {
  if constexpr (std::is_same_v<T, bool>) {
    return cfg.read_bool(key);
  } else if constexpr (std::is_integral_v<T>) {
    std::optional<T> res;
    using lim = std::numeric_limits<T>;
    if constexpr (std::is_signed_v<T>) {
      if (auto val = cfg.read_i64(key, lim::min(), lim::max()))
        res = static_cast<T>(*val);
    } else {
      if (auto val = cfg.read_u64(key, lim::max()))
        res = static_cast<T>(*val);
    }
    return res;
  } else if constexpr (std::is_same_v<T, double>) {
    return cfg.read_double(key);
  } else if constexpr (std::is_same_v<T, timespan>) {
    return cfg.read_ts(key);
  } else {
    static_assert(std::is_same_v<T, std::string>);
    return cfg.read_str(key);
  }
}

} // namespace sortfeed
