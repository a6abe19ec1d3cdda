#include <tollbooth/schema/key/builder.hpp>
#include <tollbooth/schema/key/nonce_record.hpp>

using namespace tollbooth::schema;

namespace tollbooth::schema::key {

bytes_t make_nonce_key(const bytes_view_t& payer,
                       const std::string_view network,
                       const nonce_t& nonce) {
  auto b = builder{};
  b.write(kNoncePrefix);
  b.write_prefixed(network);
  b.write_prefixed(payer);
  b.write(nonce);
  return b.data;
}

bytes_t make_reservation_key(const timestamp_milliseconds_t reserved_at,
                             const bytes_view_t& payer,
                             const std::string_view network,
                             const nonce_t& nonce) {
  auto b = builder{};
  b.write(kReservationPrefix);
  b.write_be(reserved_at);
  b.write(std::span<const uint8_t>{make_nonce_key(payer, network, nonce)});
  return b.data;
}

bytes_t make_reservation_bound(const timestamp_milliseconds_t cutoff) {
  auto b = builder{};
  b.write(kReservationPrefix);
  b.write_be(cutoff);
  return b.data;
}

}  // namespace tollbooth::schema::key
