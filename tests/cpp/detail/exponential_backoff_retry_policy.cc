#define SUITE detail.exponential_backoff_retry_policy

#include "sortfeed/detail/exponential_backoff_retry_policy.hh"

#include "test.hh"

#include <chrono>

using sortfeed::detail::retry_policy_result;

using namespace sortfeed;
using namespace std::literals;

namespace {

struct fixture {
  retry_options opts;

  fixture() {
    opts.initial_backoff = 1ms;
    opts.max_backoff = 4ms;
    opts.factor = 2.0;
    opts.jitter = false;
  }
};

} // namespace

FIXTURE_SCOPE(exponential_backoff_retry_policy_tests, fixture)

TEST(the backoff doubles up to the maximum) {
  detail::exponential_backoff_retry_policy policy{opts};
  CHECK_EQUAL(policy.attempts(), 0u);
  CHECK_EQUAL(policy(), retry_policy_result::try_again);
  CHECK_EQUAL(policy.delay(), timespan{1ms});
  CHECK_EQUAL(policy(), retry_policy_result::try_again);
  CHECK_EQUAL(policy.delay(), timespan{2ms});
  CHECK_EQUAL(policy(), retry_policy_result::try_again);
  CHECK_EQUAL(policy.delay(), timespan{4ms});
  CHECK_EQUAL(policy(), retry_policy_result::try_again);
  CHECK_EQUAL(policy.delay(), timespan{4ms});
  CHECK_EQUAL(policy.attempts(), 4u);
  MESSAGE("we can repeat the cycle after calling reset");
  policy.reset();
  CHECK_EQUAL(policy.attempts(), 0u);
  CHECK_EQUAL(policy(), retry_policy_result::try_again);
  CHECK_EQUAL(policy.delay(), timespan{1ms});
}

TEST(setting a factor allows longer or shorter intervals) {
  opts.factor = 1.5;
  opts.max_backoff = 10ms;
  detail::exponential_backoff_retry_policy policy{opts};
  CHECK_EQUAL(policy(), retry_policy_result::try_again);
  CHECK_EQUAL(policy.delay(), timespan{1ms});
  CHECK_EQUAL(policy(), retry_policy_result::try_again);
  CHECK_EQUAL(policy.delay(), timespan{1500us});
  CHECK_EQUAL(policy(), retry_policy_result::try_again);
  CHECK_EQUAL(policy.delay(), timespan{2250us});
}

TEST(the backoff never drops below the initial value) {
  opts.factor = 0.5;
  detail::exponential_backoff_retry_policy policy{opts};
  for (int i = 0; i < 5; ++i) {
    CHECK_EQUAL(policy(), retry_policy_result::try_again);
    CHECK_EQUAL(policy.delay(), timespan{1ms});
  }
}

TEST(max_attempts bounds the total number of attempts) {
  opts.max_attempts = 3;
  detail::exponential_backoff_retry_policy policy{opts};
  CHECK_EQUAL(policy(), retry_policy_result::try_again);
  CHECK_EQUAL(policy(), retry_policy_result::try_again);
  CHECK_EQUAL(policy(), retry_policy_result::abort);
  policy.reset();
  CHECK_EQUAL(policy(), retry_policy_result::try_again);
}

TEST(setting max_attempts to 1 disables retries) {
  opts.max_attempts = 1;
  detail::exponential_backoff_retry_policy policy{opts};
  CHECK_EQUAL(policy(), retry_policy_result::abort);
}

TEST(an expired timeout aborts) {
  opts.timeout = timespan{0};
  detail::exponential_backoff_retry_policy policy{opts};
  CHECK_EQUAL(policy(), retry_policy_result::abort);
}

TEST(delays never exceed the remaining time) {
  opts.initial_backoff = 10s;
  opts.max_backoff = 10s;
  opts.timeout = 50ms;
  detail::exponential_backoff_retry_policy policy{opts};
  REQUIRE_EQUAL(policy(), retry_policy_result::try_again);
  CHECK_LESS_EQUAL(policy.delay(), timespan{50ms});
}

TEST(jitter draws delays between zero and the backoff) {
  opts.jitter = true;
  opts.max_backoff = 1ms;
  detail::exponential_backoff_retry_policy policy{opts};
  for (int i = 0; i < 100; ++i) {
    CHECK_EQUAL(policy(), retry_policy_result::try_again);
    CHECK_GREATER_EQUAL(policy.delay(), timespan{0});
    CHECK_LESS_EQUAL(policy.delay(), timespan{1ms});
  }
}

TEST(the jitter generator is seeded on the first conflict only) {
  opts.jitter = true;
  detail::exponential_backoff_retry_policy policy{opts};
  policy.reset();
  CHECK(!policy.seeded());
  CHECK_EQUAL(policy(), retry_policy_result::try_again);
  CHECK(policy.seeded());
  MESSAGE("without jitter, the policy never needs a random seed");
  opts.jitter = false;
  detail::exponential_backoff_retry_policy plain{opts};
  CHECK_EQUAL(plain(), retry_policy_result::try_again);
  CHECK(!plain.seeded());
}

FIXTURE_SCOPE_END()
