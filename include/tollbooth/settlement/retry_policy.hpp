#pragma once
#include <tollbooth/schema/primitives.hpp>

#include <cstdint>

namespace tollbooth::settlement {

/// Bounded exponential backoff for transient chain failures. The first try is
/// free; `max_retries` more follow, so a payment gets at most
/// `max_retries + 1` submission tries.
struct retry_policy final {
  tollbooth::schema::duration_milliseconds_t initial_delay{500};
  double multiplier{2.0};
  uint32_t max_retries{3};

  uint32_t max_tries() const { return max_retries + 1; }

  /// Delay before try number `attempt` (1-based); zero for the first.
  tollbooth::schema::duration_milliseconds_t delay_for(uint32_t attempt) const;
};

}  // namespace tollbooth::settlement
