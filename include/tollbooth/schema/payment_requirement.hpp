#pragma once
#include <tollbooth/schema/network.hpp>
#include <tollbooth/schema/payment_scheme.hpp>
#include <tollbooth/schema/primitives.hpp>

#include <string>

// Schema type: payment requirement.
// What a protected resource demands before it is served. Immutable once
// declared; identified by (resource, scheme, network).
namespace tollbooth::schema {

inline constexpr auto kDefaultEip712Name = std::string_view{"USD Coin"};
inline constexpr auto kDefaultEip712Version = std::string_view{"2"};

struct payment_requirement final {
  payment_scheme scheme{payment_scheme::exact};
  network_t network;
  // Token contract (EVM) or mint (Ed25519).
  address_t asset;
  amount_t max_amount_required{0};
  address_t pay_to;
  uint64_t max_timeout_seconds{0};
  std::string resource;
  std::string description;
  std::string mime_type;
  // EIP-712 domain of the token contract.
  std::string eip712_name{kDefaultEip712Name};
  std::string eip712_version{kDefaultEip712Version};

  bool operator==(const payment_requirement&) const = default;
};

using payment_requirement_t = payment_requirement;

}  // namespace tollbooth::schema
