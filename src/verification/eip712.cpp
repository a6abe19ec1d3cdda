#include <tollbooth/crypto/verify.hpp>
#include <tollbooth/verification/eip712.hpp>

#include <algorithm>
#include <iterator>

using namespace tollbooth::schema;

namespace tollbooth::verification::eip712 {

namespace {

// ABI head words are 32 bytes, values right aligned.
void append_word(bytes_t& out, const bytes_view_t& value) {
  auto padding = value.size() < 32 ? 32 - value.size() : 0;
  out.insert(std::end(out), padding, uint8_t{0});
  out.insert(std::end(out), std::begin(value), std::end(value));
}

void append_word(bytes_t& out, const amount_t& value) {
  auto word = to_be_bytes32(value);
  out.insert(std::end(out), std::begin(word), std::end(word));
}

std::optional<hash32_t> keccak(const std::string_view& text) {
  return tollbooth::crypto::keccak256(make_bytes_view(text));
}

}  // namespace

std::optional<hash32_t> domain_separator(
    const payment_requirement_t& requirement) {
  auto type_hash = keccak(kDomainType);
  auto name_hash = keccak(requirement.eip712_name);
  auto version_hash = keccak(requirement.eip712_version);
  if (!type_hash || !name_hash || !version_hash) {
    return std::nullopt;
  }
  auto encoded = bytes_t{};
  encoded.reserve(5 * 32);
  append_word(encoded, *type_hash);
  append_word(encoded, *name_hash);
  append_word(encoded, *version_hash);
  append_word(encoded, amount_t{requirement.network.chain_id});
  append_word(encoded, requirement.asset);
  return tollbooth::crypto::keccak256(encoded);
}

std::optional<hash32_t> struct_hash(
    const payment_authorization_t& authorization) {
  auto type_hash = keccak(kTransferWithAuthorizationType);
  if (!type_hash) {
    return std::nullopt;
  }
  auto encoded = bytes_t{};
  encoded.reserve(7 * 32);
  append_word(encoded, *type_hash);
  append_word(encoded, authorization.payer);
  append_word(encoded, authorization.payee);
  append_word(encoded, authorization.amount);
  append_word(encoded, amount_t{authorization.valid_after});
  append_word(encoded, amount_t{authorization.valid_before});
  append_word(encoded, authorization.nonce);
  return tollbooth::crypto::keccak256(encoded);
}

std::optional<hash32_t> digest(const payment_authorization_t& authorization,
                               const payment_requirement_t& requirement) {
  auto domain = domain_separator(requirement);
  auto message = struct_hash(authorization);
  if (!domain || !message) {
    return std::nullopt;
  }
  auto encoded = bytes_t{0x19, 0x01};
  encoded.reserve(2 + 64);
  encoded.insert(std::end(encoded), std::begin(*domain), std::end(*domain));
  encoded.insert(std::end(encoded), std::begin(*message), std::end(*message));
  return tollbooth::crypto::keccak256(encoded);
}

}  // namespace tollbooth::verification::eip712
