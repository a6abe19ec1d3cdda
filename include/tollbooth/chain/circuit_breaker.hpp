#pragma once
#include <tollbooth/schema/enum_string.hpp>
#include <tollbooth/schema/primitives.hpp>

#include <array>
#include <functional>
#include <mutex>

namespace tollbooth::chain {

enum class breaker_state : uint8_t {
  closed = 0,
  open = 1,
  half_open = 2,
};

inline constexpr auto kBreakerStateMappings = std::array{
    std::pair<std::string_view, breaker_state>{"closed", breaker_state::closed},
    std::pair<std::string_view, breaker_state>{"open", breaker_state::open},
    std::pair<std::string_view, breaker_state>{"half_open",
                                               breaker_state::half_open},
};

inline constexpr std::string_view to_string(const breaker_state value) {
  return tollbooth::schema::to_string(value, kBreakerStateMappings, "unknown");
}

struct breaker_options final {
  uint32_t failure_threshold{5};
  tollbooth::schema::duration_milliseconds_t cooldown{30'000};
};

/// Per-network breaker. Opens after `failure_threshold` consecutive failures,
/// lets one trial call through after `cooldown`, closes on its success.
class circuit_breaker final {
 public:
  using clock_fn = std::function<tollbooth::schema::timestamp_milliseconds_t()>;

  circuit_breaker(breaker_options options, clock_fn clock);

  /// False while open. Moving from open to half_open admits exactly one
  /// caller until that caller reports back.
  bool allow();
  void record_success();
  void record_failure();

  breaker_state state() const;

 private:
  breaker_options options_;
  clock_fn clock_;
  mutable std::mutex mutex_;
  breaker_state state_{breaker_state::closed};
  uint32_t failures_{0};
  tollbooth::schema::timestamp_milliseconds_t opened_at_{0};
};

}  // namespace tollbooth::chain
