#pragma once

#include <tollbooth/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: payment status.
// Settlement lifecycle of one authorization. Only the settlement coordinator
// moves a record between these.
namespace tollbooth::schema {

enum class payment_status : uint8_t {
  requested = 0,
  verified = 1,
  reserved = 2,
  submitting = 3,
  submitted = 4,
  confirming = 5,
  settled = 6,
  rejected = 7,
  submission_failed = 8,
  expired = 9,
  settlement_timeout = 10,
};

inline constexpr auto kPaymentStatusMappings = std::array{
    std::pair<std::string_view, payment_status>{"requested",
                                                payment_status::requested},
    std::pair<std::string_view, payment_status>{"verified",
                                                payment_status::verified},
    std::pair<std::string_view, payment_status>{"reserved",
                                                payment_status::reserved},
    std::pair<std::string_view, payment_status>{"submitting",
                                                payment_status::submitting},
    std::pair<std::string_view, payment_status>{"submitted",
                                                payment_status::submitted},
    std::pair<std::string_view, payment_status>{"confirming",
                                                payment_status::confirming},
    std::pair<std::string_view, payment_status>{"settled",
                                                payment_status::settled},
    std::pair<std::string_view, payment_status>{"rejected",
                                                payment_status::rejected},
    std::pair<std::string_view, payment_status>{
        "submission_failed", payment_status::submission_failed},
    std::pair<std::string_view, payment_status>{"expired",
                                                payment_status::expired},
    std::pair<std::string_view, payment_status>{
        "settlement_timeout", payment_status::settlement_timeout},
};

template <>
inline std::optional<payment_status> try_from_string<payment_status>(
    const std::string_view value) {
  return from_string(value, kPaymentStatusMappings);
}

inline constexpr std::string_view to_string(const payment_status value) {
  return to_string(value, kPaymentStatusMappings, "unknown");
}

/// Terminal statuses trigger a settlement notification. settlement_timeout is
/// terminal but a later on-chain confirmation may still supersede it.
inline constexpr bool is_terminal(const payment_status value) {
  switch (value) {
    case payment_status::settled:
    case payment_status::rejected:
    case payment_status::submission_failed:
    case payment_status::expired:
    case payment_status::settlement_timeout:
      return true;
    default:
      return false;
  }
}

/// The nonce was never consumed (or was released), so a new settle attempt
/// for the same authorization may start over.
inline constexpr bool is_restartable(const payment_status value) {
  return value == payment_status::rejected ||
         value == payment_status::submission_failed ||
         value == payment_status::expired;
}

}  // namespace tollbooth::schema
