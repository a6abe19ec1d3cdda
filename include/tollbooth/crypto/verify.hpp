#pragma once

#include <tollbooth/schema/primitives.hpp>

#include <optional>

namespace tollbooth::crypto {

/// Ed25519 and secp256k1 are usable in this OpenSSL build.
bool available();

/// Keccak-256 (pre-NIST padding) needs OpenSSL 3.2 or later.
bool keccak_available();

std::optional<tollbooth::schema::hash32_t> keccak256(
    const tollbooth::schema::bytes_view_t& data);

bool verify_ed25519(const tollbooth::schema::bytes_view_t& message,
                    const tollbooth::schema::bytes_view_t& public_key,
                    const tollbooth::schema::bytes_view_t& signature);

/// Recovers the 65-byte uncompressed secp256k1 public key from a 65-byte
/// r || s || v signature over `digest`. v may be 0, 1, 27 or 28; high-s
/// signatures are rejected.
std::optional<tollbooth::schema::bytes_t> recover_secp256k1(
    const tollbooth::schema::hash32_t& digest,
    const tollbooth::schema::bytes_view_t& signature);

/// keccak256(public_key[1:])[12:]
std::optional<tollbooth::schema::address_t> evm_address(
    const tollbooth::schema::bytes_view_t& uncompressed_public_key);

std::optional<tollbooth::schema::address_t> recover_evm_address(
    const tollbooth::schema::hash32_t& digest,
    const tollbooth::schema::bytes_view_t& signature);

}  // namespace tollbooth::crypto
