#include <algorithm>
#include <iterator>
#include <ranges>
#include <tollbooth/blake3/hash.hpp>
#include <tollbooth/schema/key/builder.hpp>

using namespace tollbooth::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write_prefixed(const std::string_view& str) {
  write(static_cast<uint32_t>(str.size()));
  return write(str);
}

builder& builder::write_prefixed(const std::span<const uint8_t>& bytes) {
  write(static_cast<uint32_t>(bytes.size()));
  return write(bytes);
}

builder& builder::hash(const std::string_view& str) {
  auto digest = tollbooth::blake3::hash(str);
  return write(std::span<const uint8_t>{digest});
}

builder& builder::hash(const std::span<const uint8_t>& bytes) {
  auto digest = tollbooth::blake3::hash(bytes);
  return write(std::span<const uint8_t>{digest});
}
