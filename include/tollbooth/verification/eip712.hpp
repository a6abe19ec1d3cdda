#pragma once
#include <tollbooth/schema/payment_authorization.hpp>
#include <tollbooth/schema/payment_requirement.hpp>

#include <optional>

// EIP-712 typed data for EIP-3009 TransferWithAuthorization. Every function
// returns std::nullopt when Keccak-256 is unavailable.
namespace tollbooth::verification::eip712 {

inline constexpr auto kDomainType = std::string_view{
    "EIP712Domain(string name,string version,uint256 chainId,address "
    "verifyingContract)"};
inline constexpr auto kTransferWithAuthorizationType = std::string_view{
    "TransferWithAuthorization(address from,address to,uint256 value,uint256 "
    "validAfter,uint256 validBefore,bytes32 nonce)"};

/// Domain of the token contract named by the requirement's asset.
std::optional<tollbooth::schema::hash32_t> domain_separator(
    const tollbooth::schema::payment_requirement_t& requirement);

std::optional<tollbooth::schema::hash32_t> struct_hash(
    const tollbooth::schema::payment_authorization_t& authorization);

/// keccak256(0x19 0x01 || domainSeparator || structHash)
std::optional<tollbooth::schema::hash32_t> digest(
    const tollbooth::schema::payment_authorization_t& authorization,
    const tollbooth::schema::payment_requirement_t& requirement);

}  // namespace tollbooth::verification::eip712
