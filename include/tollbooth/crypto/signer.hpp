#pragma once

#include <tollbooth/schema/primitives.hpp>

#include <memory>
#include <optional>

struct evp_pkey_st;

namespace tollbooth::crypto {

/// Facilitator-side Ed25519 key, used to co-sign settlement envelopes.
class ed25519_signer final {
 public:
  static std::optional<ed25519_signer> from_seed(
      const tollbooth::schema::bytes_view_t& seed);

  const tollbooth::schema::bytes_t& public_key() const { return public_key_; }

  /// 64-byte signature, std::nullopt if OpenSSL refuses.
  std::optional<tollbooth::schema::bytes_t> sign(
      const tollbooth::schema::bytes_view_t& message) const;

 private:
  ed25519_signer(std::shared_ptr<evp_pkey_st> key,
                 tollbooth::schema::bytes_t public_key);

  std::shared_ptr<evp_pkey_st> key_;
  tollbooth::schema::bytes_t public_key_;
};

/// Facilitator-side secp256k1 key, used to sign EVM settlement transactions.
class secp256k1_signer final {
 public:
  static std::optional<secp256k1_signer> from_private_key(
      const tollbooth::schema::bytes_view_t& private_key);

  /// 65-byte uncompressed public key.
  const tollbooth::schema::bytes_t& public_key() const { return public_key_; }

  /// Low-s r || s || v over a 32-byte prehashed digest, v in {0, 1}.
  std::optional<tollbooth::schema::bytes_t> sign(
      const tollbooth::schema::hash32_t& digest) const;

 private:
  secp256k1_signer(std::shared_ptr<evp_pkey_st> key,
                   tollbooth::schema::bytes_t public_key);

  std::shared_ptr<evp_pkey_st> key_;
  tollbooth::schema::bytes_t public_key_;
};

}  // namespace tollbooth::crypto
