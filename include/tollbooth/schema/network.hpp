#pragma once

#include <tollbooth/schema/enum_string.hpp>
#include <tollbooth/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: network.
// A settlement chain: its family decides the signature scheme, address format
// and finality model.
namespace tollbooth::schema {

enum class chain_family : uint8_t {
  evm = 0,
  ed25519 = 1,
};

inline constexpr auto kChainFamilyMappings = std::array{
    std::pair<std::string_view, chain_family>{"evm", chain_family::evm},
    std::pair<std::string_view, chain_family>{"ed25519", chain_family::ed25519},
};

template <>
inline std::optional<chain_family> try_from_string<chain_family>(
    const std::string_view value) {
  return from_string(value, kChainFamilyMappings);
}

inline constexpr std::string_view to_string(const chain_family value) {
  return to_string(value, kChainFamilyMappings, "unknown");
}

struct network final {
  std::string name;
  chain_family family{chain_family::evm};
  uint64_t chain_id{0};

  bool operator==(const network&) const = default;
};

using network_t = network;

struct known_network final {
  std::string_view name;
  chain_family family;
  uint64_t chain_id;
  uint32_t confirmations;
};

inline constexpr auto kKnownNetworks = std::array{
    known_network{"base", chain_family::evm, 8453, 1},
    known_network{"base-sepolia", chain_family::evm, 84532, 1},
    known_network{"ethereum", chain_family::evm, 1, 12},
    known_network{"sepolia", chain_family::evm, 11155111, 3},
    known_network{"polygon", chain_family::evm, 137, 64},
    known_network{"arbitrum", chain_family::evm, 42161, 1},
    known_network{"optimism", chain_family::evm, 10, 1},
    known_network{"avalanche", chain_family::evm, 43114, 1},
    known_network{"solana", chain_family::ed25519, 101, 32},
    known_network{"solana-devnet", chain_family::ed25519, 103, 1},
};

std::optional<known_network> find_known_network(std::string_view name);
std::optional<network_t> try_make_network(std::string_view name);

/// 20 bytes for EVM, 32 bytes for Ed25519.
std::size_t address_size(chain_family family);
bool is_well_formed_address(chain_family family, const bytes_view_t& address);

/// EVM: 0x-prefixed 40 hex digits. Ed25519: base58 of a 32-byte key.
std::optional<address_t> try_parse_address(chain_family family,
                                           std::string_view text);
std::string format_address(chain_family family, const bytes_view_t& address);

}  // namespace tollbooth::schema
