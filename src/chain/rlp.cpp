#include <tollbooth/chain/rlp.hpp>

#include <iterator>

using namespace tollbooth::schema;

namespace tollbooth::chain::rlp {

namespace {

bytes_t encode_length(const std::size_t length, const uint8_t offset) {
  if (length < 56) {
    return {static_cast<uint8_t>(offset + length)};
  }
  auto length_bytes = to_minimal_be_bytes(amount_t{length});
  auto out = bytes_t{static_cast<uint8_t>(offset + 55 + length_bytes.size())};
  out.insert(std::end(out), std::begin(length_bytes), std::end(length_bytes));
  return out;
}

}  // namespace

bytes_t encode_bytes(const bytes_view_t& bytes) {
  if (bytes.size() == 1 && bytes[0] < 0x80) {
    return {bytes[0]};
  }
  auto out = encode_length(bytes.size(), 0x80);
  out.insert(std::end(out), std::begin(bytes), std::end(bytes));
  return out;
}

bytes_t encode_uint(const amount_t& value) {
  return encode_bytes(to_minimal_be_bytes(value));
}

bytes_t encode_list(const std::vector<bytes_t>& items) {
  auto payload_size = std::size_t{0};
  for (const auto& item : items) {
    payload_size += item.size();
  }
  auto out = encode_length(payload_size, 0xc0);
  out.reserve(out.size() + payload_size);
  for (const auto& item : items) {
    out.insert(std::end(out), std::begin(item), std::end(item));
  }
  return out;
}

}  // namespace tollbooth::chain::rlp
