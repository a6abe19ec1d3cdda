#pragma once
#include <tollbooth/schema/network.hpp>
#include <tollbooth/schema/payment_scheme.hpp>
#include <tollbooth/schema/primitives.hpp>

// Schema type: payment authorization.
// A payer's signed, off-chain permission to move `amount` to `payee` inside
// [valid_after, valid_before]. Immutable once signed.
namespace tollbooth::schema {

struct payment_authorization final {
  payment_scheme scheme{payment_scheme::exact};
  network_t network;
  address_t payer;
  address_t payee;
  amount_t amount{0};
  timestamp_seconds_t valid_after{0};
  timestamp_seconds_t valid_before{0};
  nonce_t nonce{};
  // 65-byte r||s||v on EVM networks, 64-byte Ed25519 signature otherwise.
  bytes_t signature;

  bool operator==(const payment_authorization&) const = default;
};

using payment_authorization_t = payment_authorization;

}  // namespace tollbooth::schema
