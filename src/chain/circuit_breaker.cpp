#include <tollbooth/chain/circuit_breaker.hpp>

#include <spdlog/spdlog.h>

namespace tollbooth::chain {

circuit_breaker::circuit_breaker(breaker_options options, clock_fn clock)
    : options_{options}, clock_{std::move(clock)} {}

bool circuit_breaker::allow() {
  auto lock = std::scoped_lock{mutex_};
  switch (state_) {
    case breaker_state::closed:
      return true;
    case breaker_state::open:
      if (clock_() >= opened_at_ + options_.cooldown) {
        state_ = breaker_state::half_open;
        return true;
      }
      return false;
    case breaker_state::half_open:
      return false;
  }
  return false;
}

void circuit_breaker::record_success() {
  auto lock = std::scoped_lock{mutex_};
  if (state_ != breaker_state::closed) {
    spdlog::info("circuit closed after successful trial call");
  }
  state_ = breaker_state::closed;
  failures_ = 0;
}

void circuit_breaker::record_failure() {
  auto lock = std::scoped_lock{mutex_};
  ++failures_;
  if (state_ == breaker_state::half_open ||
      (state_ == breaker_state::closed &&
       failures_ >= options_.failure_threshold)) {
    state_ = breaker_state::open;
    opened_at_ = clock_();
  }
}

breaker_state circuit_breaker::state() const {
  auto lock = std::scoped_lock{mutex_};
  return state_;
}

}  // namespace tollbooth::chain
