#pragma once
#include <tollbooth/schema/primitives.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace tollbooth::schema::key {

struct builder final {
  tollbooth::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  /// Writes a little-endian u32 length followed by the bytes, so adjacent
  /// variable length fields cannot alias each other.
  builder& write_prefixed(const std::string_view& str);
  builder& write_prefixed(const std::span<const uint8_t>& bytes);

  builder& hash(const std::string_view& str);
  builder& hash(const std::span<const uint8_t>& bytes);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
      data.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
    return *this;
  }

  /// Big-endian, so byte order matches numeric order in range scans.
  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write_be(T value) {
    for (size_t i = sizeof(T); i > 0; --i) {
      data.push_back(static_cast<uint8_t>((value >> ((i - 1) * 8)) & 0xFF));
    }
    return *this;
  }
};

}  // namespace tollbooth::schema::key
