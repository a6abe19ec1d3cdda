#pragma once
#include <tollbooth/schema/payment_authorization.hpp>
#include <tollbooth/schema/payment_requirement.hpp>

namespace tollbooth::verification {

inline constexpr auto kEd25519MessageTag =
    std::string_view{"tollbooth:ed25519:v1"};

/// Canonical bytes an Ed25519 payer signs:
///   tag
///   || len32(network) network || len32(asset) asset
///   || len32(payer) payer || len32(payee) payee
///   || amount (32 bytes, big endian)
///   || valid_after (u64 le) || valid_before (u64 le)
///   || nonce (32 bytes)
/// Lengths are little-endian u32.
tollbooth::schema::bytes_t make_ed25519_message(
    const tollbooth::schema::payment_authorization_t& authorization,
    const tollbooth::schema::payment_requirement_t& requirement);

}  // namespace tollbooth::verification
