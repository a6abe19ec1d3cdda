#include <tollbooth/schema/network.hpp>

namespace tollbooth::schema {

std::optional<known_network> find_known_network(const std::string_view name) {
  for (const auto& entry : kKnownNetworks) {
    if (entry.name == name) {
      return entry;
    }
  }
  return std::nullopt;
}

std::optional<network_t> try_make_network(const std::string_view name) {
  auto entry = find_known_network(name);
  if (!entry) {
    return std::nullopt;
  }
  return network_t{.name = std::string{entry->name},
                   .family = entry->family,
                   .chain_id = entry->chain_id};
}

std::size_t address_size(const chain_family family) {
  switch (family) {
    case chain_family::evm:
      return 20;
    case chain_family::ed25519:
      return 32;
  }
  return 0;
}

bool is_well_formed_address(const chain_family family,
                            const bytes_view_t& address) {
  return address.size() == address_size(family);
}

std::optional<address_t> try_parse_address(const chain_family family,
                                           const std::string_view text) {
  auto decoded = std::optional<bytes_t>{};
  switch (family) {
    case chain_family::evm:
      if (text.size() != 42 || !text.starts_with("0x")) {
        return std::nullopt;
      }
      decoded = try_from_hex(text);
      break;
    case chain_family::ed25519:
      decoded = try_from_base58(text);
      break;
  }
  if (!decoded || !is_well_formed_address(family, *decoded)) {
    return std::nullopt;
  }
  return decoded;
}

std::string format_address(const chain_family family,
                           const bytes_view_t& address) {
  switch (family) {
    case chain_family::evm:
      return to_hex_prefixed(address);
    case chain_family::ed25519:
      return to_base58(address);
  }
  return to_hex(address);
}

}  // namespace tollbooth::schema
