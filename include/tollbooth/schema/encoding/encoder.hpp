#pragma once
#include <tollbooth/schema/primitives.hpp>

#include <optional>
#include <span>

namespace tollbooth::schema::encoding {

// The wire library is a build time choice, selected by tag; hot swapping is
// not supported.
template <typename Library>
struct encoder {
  template <typename T>
  tollbooth::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, tollbooth::schema::bytes_t& out);

  template <typename T>
  T decode(const tollbooth::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tollbooth::schema::bytes_view_t& bytes);
};

}  // namespace tollbooth::schema::encoding
