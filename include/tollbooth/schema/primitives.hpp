#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tollbooth::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_seconds_t = uint64_t;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

/// Raw account bytes: 20 bytes on EVM networks, 32 on Ed25519 networks.
using address_t = bytes_t;
/// Payer chosen replay nonce, scoped to (payer, network).
using nonce_t = hash32_t;
using payment_id_t = hash32_t;
/// Chain specific transaction identifier (0x hex on EVM, base58 on Ed25519).
using transaction_ref_t = std::string;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_view_t& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

/// Lower-case hex without a prefix.
std::string to_hex(const bytes_view_t& bytes);
/// Lower-case hex with a 0x prefix.
std::string to_hex_prefixed(const bytes_view_t& bytes);
/// Accepts an optional 0x/0X prefix.
std::optional<bytes_t> try_from_hex(std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_base64(std::string_view encoded);

/// Bitcoin alphabet, as used for Ed25519 chain addresses and signatures.
std::string to_base58(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_base58(std::string_view encoded);

/// Decimal, or 0x-prefixed hex quantity. Rejects values above 2^256-1.
std::optional<amount_t> try_parse_amount(std::string_view text);
std::string to_decimal(const amount_t& amount);
/// Minimal 0x-prefixed hex quantity ("0x0" for zero).
std::string to_hex_quantity(const amount_t& amount);
/// 32-byte big-endian representation.
hash32_t to_be_bytes32(const amount_t& amount);
amount_t from_be_bytes(const bytes_view_t& bytes);
/// Minimal big-endian bytes, empty for zero.
bytes_t to_minimal_be_bytes(const amount_t& amount);

}  // namespace tollbooth::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
