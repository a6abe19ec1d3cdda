#include <tollbooth/settlement/retry_policy.hpp>

#include <cmath>

namespace tollbooth::settlement {

tollbooth::schema::duration_milliseconds_t retry_policy::delay_for(
    const uint32_t attempt) const {
  if (attempt <= 1) {
    return 0;
  }
  auto delay = static_cast<double>(initial_delay) *
               std::pow(multiplier, static_cast<double>(attempt - 2));
  return static_cast<tollbooth::schema::duration_milliseconds_t>(delay);
}

}  // namespace tollbooth::settlement
