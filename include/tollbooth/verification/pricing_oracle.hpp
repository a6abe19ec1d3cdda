#pragma once
#include <tollbooth/schema/payment_requirement.hpp>

#include <optional>

namespace tollbooth::verification {

/// Prices DYNAMIC requirements. Must be side effect free: the verifier calls
/// it from `verify`, which is pure.
struct pricing_oracle {
  virtual ~pricing_oracle() = default;

  virtual std::optional<tollbooth::schema::amount_t> quote(
      const tollbooth::schema::payment_requirement_t& requirement) const = 0;
};

}  // namespace tollbooth::verification
