#pragma once
#include <tollbooth/schema/primitives.hpp>

#include <string>

// Schema type: nonce record.
// Write-once reservation of (payer, network, nonce).
namespace tollbooth::schema {

template <uint16_t Version>
struct nonce_record;

template <>
struct nonce_record<1> final {
  address_t payer;
  std::string network;
  nonce_t nonce{};
  timestamp_milliseconds_t reserved_at{0};
};

using nonce_record_t = nonce_record<1>;

}  // namespace tollbooth::schema
