#pragma once

#include <tollbooth/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: payment scheme.
// How the authorized amount relates to the requirement's maximum.
namespace tollbooth::schema {

enum class payment_scheme : uint8_t {
  // amount == maxAmountRequired
  exact = 0,
  // amount <= maxAmountRequired
  upto = 1,
  // amount == the pricing oracle's quote
  dynamic = 2,
};

inline constexpr auto kPaymentSchemeMappings = std::array{
    std::pair<std::string_view, payment_scheme>{"exact", payment_scheme::exact},
    std::pair<std::string_view, payment_scheme>{"upto", payment_scheme::upto},
    std::pair<std::string_view, payment_scheme>{"dynamic",
                                                payment_scheme::dynamic},
};

template <>
inline std::optional<payment_scheme> try_from_string<payment_scheme>(
    const std::string_view value) {
  return from_string(value, kPaymentSchemeMappings);
}

inline constexpr std::string_view to_string(const payment_scheme value) {
  return to_string(value, kPaymentSchemeMappings, "unknown");
}

}  // namespace tollbooth::schema
