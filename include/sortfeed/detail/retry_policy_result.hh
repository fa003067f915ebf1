#pragma once

#include <string>

namespace sortfeed::detail {

/// Wraps the result of a retry policy.
enum class retry_policy_result {
  /// Indicates that a new attempt starts after the current delay.
  try_again,
  /// Indicates that the attempt or time budget is exhausted.
  abort,
};

/// @relates retry_policy_result
std::string to_string(retry_policy_result);

} // namespace sortfeed::detail
