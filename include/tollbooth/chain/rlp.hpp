#pragma once
#include <tollbooth/schema/primitives.hpp>

#include <vector>

// Recursive length prefix encoding, as used for EVM transactions.
namespace tollbooth::chain::rlp {

tollbooth::schema::bytes_t encode_bytes(
    const tollbooth::schema::bytes_view_t& bytes);

/// Big-endian with no leading zeros; zero encodes as the empty string.
tollbooth::schema::bytes_t encode_uint(const tollbooth::schema::amount_t& value);

/// `items` are already encoded.
tollbooth::schema::bytes_t encode_list(
    const std::vector<tollbooth::schema::bytes_t>& items);

}  // namespace tollbooth::chain::rlp
