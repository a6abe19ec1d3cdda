#pragma once

#include <tollbooth/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: error code.
// Verification, replay, chain and internal outcomes reported as values.
namespace tollbooth::schema {

enum class error_code : uint16_t {
  none = 0,

  // Verification.
  invalid_requirement = 1,
  recipient_mismatch = 2,
  insufficient_amount = 3,
  signature_invalid = 4,
  authorization_expired = 5,
  authorization_not_yet_valid = 6,
  unsupported_network = 7,
  malformed_authorization = 8,

  // Replay.
  duplicate_authorization = 20,

  // Chain.
  chain_unavailable = 30,
  chain_rejected = 31,
  settlement_timeout = 32,

  // Internal.
  internal_error = 40,
  payment_missing = 41,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"none", error_code::none},
    std::pair<std::string_view, error_code>{"invalid_requirement",
                                            error_code::invalid_requirement},
    std::pair<std::string_view, error_code>{"recipient_mismatch",
                                            error_code::recipient_mismatch},
    std::pair<std::string_view, error_code>{"insufficient_amount",
                                            error_code::insufficient_amount},
    std::pair<std::string_view, error_code>{"signature_invalid",
                                            error_code::signature_invalid},
    std::pair<std::string_view, error_code>{"authorization_expired",
                                            error_code::authorization_expired},
    std::pair<std::string_view, error_code>{
        "authorization_not_yet_valid", error_code::authorization_not_yet_valid},
    std::pair<std::string_view, error_code>{"unsupported_network",
                                            error_code::unsupported_network},
    std::pair<std::string_view, error_code>{
        "malformed_authorization", error_code::malformed_authorization},
    std::pair<std::string_view, error_code>{
        "duplicate_authorization", error_code::duplicate_authorization},
    std::pair<std::string_view, error_code>{"chain_unavailable",
                                            error_code::chain_unavailable},
    std::pair<std::string_view, error_code>{"chain_rejected",
                                            error_code::chain_rejected},
    std::pair<std::string_view, error_code>{"settlement_timeout",
                                            error_code::settlement_timeout},
    std::pair<std::string_view, error_code>{"internal_error",
                                            error_code::internal_error},
    std::pair<std::string_view, error_code>{"payment_missing",
                                            error_code::payment_missing},
};

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings, "unknown");
}

struct failure final {
  error_code code{error_code::internal_error};
  std::string reason;
};

}  // namespace tollbooth::schema
