#include <tollbooth/schema/encoding/scale/nonce_record.hpp>

namespace tollbooth::schema::encoding::scale {

nonce_record_wire_t to_wire(const nonce_record_t& value) {
  return {uint16_t{1}, value.payer, value.network, value.nonce,
          value.reserved_at};
}

nonce_record_t from_wire(nonce_record_wire_t&& value) {
  auto& [version, payer, network, nonce, reserved_at] = value;
  static_cast<void>(version);
  return nonce_record_t{.payer = std::move(payer),
                        .network = std::move(network),
                        .nonce = nonce,
                        .reserved_at = reserved_at};
}

}  // namespace tollbooth::schema::encoding::scale
