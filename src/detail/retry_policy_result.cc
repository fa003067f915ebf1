#include "sortfeed/detail/retry_policy_result.hh"

namespace sortfeed::detail {

std::string to_string(retry_policy_result x) {
  switch (x) {
    case retry_policy_result::try_again:
      return "try_again";
    case retry_policy_result::abort:
      return "abort";
    default:
      return "???";
  }
}

} // namespace sortfeed::detail
