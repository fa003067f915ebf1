#include "sortfeed/detail/exponential_backoff_retry_policy.hh"

#include <algorithm>
#include <thread>

namespace sortfeed::detail {

exponential_backoff_retry_policy::exponential_backoff_retry_policy(
  retry_options opts)
  : opts_(std::move(opts)),
    backoff_(opts_.initial_backoff),
    delay_(0) {
  reset();
}

void exponential_backoff_retry_policy::reset() {
  attempts_ = 0;
  backoff_ = opts_.initial_backoff;
  delay_ = timespan{0};
  if (opts_.timeout == infinite)
    deadline_ = timestamp::max();
  else
    deadline_ = now() + opts_.timeout;
}

retry_policy_result exponential_backoff_retry_policy::operator()() {
  ++attempts_;
  if (opts_.max_attempts > 0 && attempts_ >= opts_.max_attempts)
    return retry_policy_result::abort;
  auto t = now();
  if (t >= deadline_)
    return retry_policy_result::abort;
  if (opts_.jitter && backoff_.count() > 0) {
    if (!seeded_) {
      rng_.seed(std::random_device{}());
      seeded_ = true;
    }
    std::uniform_int_distribution<timespan::rep> dist{0, backoff_.count()};
    delay_ = timespan{dist(rng_)};
  } else {
    delay_ = backoff_;
  }
  // Never sleep past the deadline.
  if (deadline_ != timestamp::max())
    delay_ = std::min(delay_, timespan{deadline_ - t});
  auto next = timespan{static_cast<timespan::rep>(
    static_cast<double>(backoff_.count()) * opts_.factor)};
  backoff_ = std::min(std::max(next, opts_.initial_backoff),
                      opts_.max_backoff);
  return retry_policy_result::try_again;
}

void exponential_backoff_retry_policy::wait() const {
  if (delay_.count() > 0)
    std::this_thread::sleep_for(delay_);
}

} // namespace sortfeed::detail
