#include "sortfeed/retry_options.hh"

namespace sortfeed {

std::string to_string(const retry_options& x) {
  std::string result = "retry_options(initial_backoff = ";
  result += to_string(x.initial_backoff);
  result += ", max_backoff = ";
  result += to_string(x.max_backoff);
  result += ", factor = ";
  result += std::to_string(x.factor);
  result += ", jitter = ";
  result += x.jitter ? "true" : "false";
  result += ", max_attempts = ";
  result += std::to_string(x.max_attempts);
  result += ", timeout = ";
  result += to_string(x.timeout);
  result += ')';
  return result;
}

} // namespace sortfeed
