#pragma once

#include <utility>

namespace tollbooth::schema::encoding::scale {

/// Maps a schema type onto the tuple of primitives SCALE actually writes.
/// Types the codec understands natively pass through unchanged.
template <typename T>
struct wire final {
  using type = T;

  static const T& to(const T& value) { return value; }
  static T from(T&& value) { return std::move(value); }
};

}  // namespace tollbooth::schema::encoding::scale
