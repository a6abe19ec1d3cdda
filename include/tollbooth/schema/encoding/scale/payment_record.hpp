#pragma once
#include <tollbooth/schema/encoding/scale/wire.hpp>
#include <tollbooth/schema/payment_record.hpp>

#include <optional>
#include <string>
#include <tuple>

namespace tollbooth::schema::encoding::scale {

// name, family, chain id
using network_wire_t = std::tuple<std::string, uint8_t, uint64_t>;

// scheme, network, asset, max amount, pay to, timeout, resource, description,
// mime type, eip712 name, eip712 version
using payment_requirement_wire_t = std::tuple<uint8_t,
                                              network_wire_t,
                                              bytes_t,
                                              hash32_t,
                                              bytes_t,
                                              uint64_t,
                                              std::string,
                                              std::string,
                                              std::string,
                                              std::string,
                                              std::string>;

// scheme, network, payer, payee, amount, valid after, valid before, nonce,
// signature
using payment_authorization_wire_t = std::tuple<uint8_t,
                                                network_wire_t,
                                                bytes_t,
                                                bytes_t,
                                                hash32_t,
                                                uint64_t,
                                                uint64_t,
                                                hash32_t,
                                                bytes_t>;

using payment_record_wire_t = std::tuple<uint16_t,
                                         hash32_t,
                                         uint8_t,
                                         payment_requirement_wire_t,
                                         payment_authorization_wire_t,
                                         std::optional<std::string>,
                                         bytes_t,
                                         uint64_t,
                                         uint16_t,
                                         std::string,
                                         uint32_t,
                                         uint64_t,
                                         uint64_t,
                                         uint64_t,
                                         hash32_t>;

network_wire_t to_wire(const network_t& value);
network_t from_wire(network_wire_t&& value);

payment_requirement_wire_t to_wire(const payment_requirement_t& value);
payment_requirement_t from_wire(payment_requirement_wire_t&& value);

payment_authorization_wire_t to_wire(const payment_authorization_t& value);
payment_authorization_t from_wire(payment_authorization_wire_t&& value);

payment_record_wire_t to_wire(const payment_record_t& value);
payment_record_t from_wire(payment_record_wire_t&& value);

template <>
struct wire<payment_record_t> final {
  using type = payment_record_wire_t;

  static type to(const payment_record_t& value) { return to_wire(value); }
  static payment_record_t from(type&& value) {
    return from_wire(std::move(value));
  }
};

template <>
struct wire<payment_requirement_t> final {
  using type = payment_requirement_wire_t;

  static type to(const payment_requirement_t& value) { return to_wire(value); }
  static payment_requirement_t from(type&& value) {
    return from_wire(std::move(value));
  }
};

}  // namespace tollbooth::schema::encoding::scale
