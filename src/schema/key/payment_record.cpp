#include <algorithm>
#include <initializer_list>
#include <tollbooth/blake3/hash.hpp>
#include <tollbooth/schema/key/builder.hpp>
#include <tollbooth/schema/key/payment_record.hpp>

using namespace tollbooth::schema;

namespace tollbooth::schema::key {

payment_id_t make_payment_id(const bytes_view_t& payer,
                             const std::string_view network,
                             const nonce_t& nonce) {
  auto b = builder{};
  b.write("PAYMENT|");
  b.write_prefixed(network);
  b.write_prefixed(payer);
  b.write(nonce);
  return tollbooth::blake3::hash(b.data);
}

payment_id_t make_payment_id(const payment_authorization_t& authorization) {
  return make_payment_id(authorization.payer, authorization.network.name,
                         authorization.nonce);
}

bytes_t make_payment_key(const payment_id_t& id) {
  auto b = builder{};
  b.write(kPaymentPrefix);
  b.write(id);
  return b.data;
}

bytes_t make_open_payment_key(const payment_id_t& id) {
  auto b = builder{};
  b.write(kOpenPaymentPrefix);
  b.write(id);
  return b.data;
}

bytes_t make_party_prefix(const std::string_view index,
                          const bytes_view_t& party) {
  auto b = builder{};
  b.write(index);
  b.write_prefixed(party);
  return b.data;
}

bytes_t make_party_key(const std::string_view index,
                       const bytes_view_t& party,
                       const timestamp_milliseconds_t created_at,
                       const payment_id_t& id) {
  auto b = builder{};
  b.data = make_party_prefix(index, party);
  b.write_be(~created_at);
  b.write(id);
  return b.data;
}

std::optional<payment_id_t> try_payment_id_from_key(const bytes_view_t& key) {
  for (const auto prefix : {kPaymentPrefix, kOpenPaymentPrefix}) {
    if (key.size() == prefix.size() + 32 &&
        std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
      return make_hash32(key.subspan(prefix.size()));
    }
  }
  for (const auto prefix : {kPayerIndexPrefix, kPayeeIndexPrefix}) {
    if (key.size() > prefix.size() + 32 &&
        std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
      return make_hash32(key.last(32));
    }
  }
  return std::nullopt;
}

}  // namespace tollbooth::schema::key
