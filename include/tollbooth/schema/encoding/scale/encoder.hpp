#pragma once
#include <tollbooth/common/critical.hpp>
#include <tollbooth/schema/encoding/encoder.hpp>
#include <tollbooth/schema/encoding/scale/nonce_record.hpp>
#include <tollbooth/schema/encoding/scale/payment_record.hpp>
#include <tollbooth/schema/encoding/scale/wire.hpp>

#include <iterator>
#include <scale/scale.hpp>
#include <utility>

namespace tollbooth::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  tollbooth::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, tollbooth::schema::bytes_t& out);

  template <typename T>
  T decode(const tollbooth::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tollbooth::schema::bytes_view_t& bytes);
};

template <typename T>
tollbooth::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(scale::wire<T>::to(obj));
  if (!encoded) {
    tollbooth::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        tollbooth::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const tollbooth::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    tollbooth::common::critical("failed to decode SCALE bytes");
  }
  return std::move(*decoded);
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const tollbooth::schema::bytes_view_t& bytes) {
  using wire_t = typename scale::wire<T>::type;
  auto decoded = ::scale::impl::memory::decode<wire_t>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return scale::wire<T>::from(std::move(decoded.value()));
}

}  // namespace tollbooth::schema::encoding
