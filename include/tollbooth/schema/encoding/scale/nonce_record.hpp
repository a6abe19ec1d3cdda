#pragma once
#include <tollbooth/schema/encoding/scale/wire.hpp>
#include <tollbooth/schema/nonce_record.hpp>

#include <string>
#include <tuple>

namespace tollbooth::schema::encoding::scale {

using nonce_record_wire_t =
    std::tuple<uint16_t, bytes_t, std::string, hash32_t, uint64_t>;

nonce_record_wire_t to_wire(const nonce_record_t& value);
nonce_record_t from_wire(nonce_record_wire_t&& value);

template <>
struct wire<nonce_record_t> final {
  using type = nonce_record_wire_t;

  static type to(const nonce_record_t& value) { return to_wire(value); }
  static nonce_record_t from(type&& value) {
    return from_wire(std::move(value));
  }
};

}  // namespace tollbooth::schema::encoding::scale
