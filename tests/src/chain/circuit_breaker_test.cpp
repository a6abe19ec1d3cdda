#include <gtest/gtest.h>
#include <tollbooth/chain/circuit_breaker.hpp>
#include <tollbooth/testing/fixtures.hpp>

using tollbooth::chain::breaker_options;
using tollbooth::chain::breaker_state;
using tollbooth::chain::circuit_breaker;

TEST(circuit_breaker, opens_after_consecutive_failures) {
  auto clock = tollbooth::testing::manual_clock{};
  auto breaker = circuit_breaker{
      breaker_options{.failure_threshold = 3, .cooldown = 1000}, clock.fn()};

  breaker.record_failure();
  breaker.record_failure();
  EXPECT_EQ(breaker.state(), breaker_state::closed);
  EXPECT_TRUE(breaker.allow());

  breaker.record_failure();
  EXPECT_EQ(breaker.state(), breaker_state::open);
  EXPECT_FALSE(breaker.allow());
}

TEST(circuit_breaker, success_resets_the_count) {
  auto clock = tollbooth::testing::manual_clock{};
  auto breaker = circuit_breaker{
      breaker_options{.failure_threshold = 2, .cooldown = 1000}, clock.fn()};

  breaker.record_failure();
  breaker.record_success();
  breaker.record_failure();
  EXPECT_EQ(breaker.state(), breaker_state::closed);
}

TEST(circuit_breaker, half_open_admits_one_trial) {
  auto clock = tollbooth::testing::manual_clock{};
  auto breaker = circuit_breaker{
      breaker_options{.failure_threshold = 1, .cooldown = 1000}, clock.fn()};

  breaker.record_failure();
  ASSERT_EQ(breaker.state(), breaker_state::open);

  clock.advance(999);
  EXPECT_FALSE(breaker.allow());

  clock.advance(1);
  EXPECT_TRUE(breaker.allow());
  EXPECT_EQ(breaker.state(), breaker_state::half_open);
  EXPECT_FALSE(breaker.allow());

  breaker.record_success();
  EXPECT_EQ(breaker.state(), breaker_state::closed);
  EXPECT_TRUE(breaker.allow());
}

TEST(circuit_breaker, failed_trial_reopens) {
  auto clock = tollbooth::testing::manual_clock{};
  auto breaker = circuit_breaker{
      breaker_options{.failure_threshold = 1, .cooldown = 1000}, clock.fn()};

  breaker.record_failure();
  clock.advance(1000);
  ASSERT_TRUE(breaker.allow());
  breaker.record_failure();
  EXPECT_EQ(breaker.state(), breaker_state::open);
  EXPECT_FALSE(breaker.allow());

  clock.advance(1000);
  EXPECT_TRUE(breaker.allow());
}
