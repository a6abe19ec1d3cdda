#pragma once
#include <tollbooth/schema/primitives.hpp>

#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace tollbooth::storage {

using key_value_entry_t =
    std::pair<tollbooth::schema::bytes_t, tollbooth::schema::bytes_t>;

/// One mutation of an atomic batch; std::nullopt deletes the key.
using write_entry_t = std::pair<tollbooth::schema::bytes_t,
                                std::optional<tollbooth::schema::bytes_t>>;

/// Read or write failure reported by the backend after it was opened.
class storage_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const tollbooth::schema::bytes_view_t& key) const;

  /// Encode and durably persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const tollbooth::schema::bytes_view_t& key,
           const T& value) const;

  /// Persist value at key only if the key is absent. Returns false when the
  /// key already existed; the stored value is left untouched.
  template <typename T, typename Encoder>
  bool put_if_absent(Encoder& encoder,
                     const tollbooth::schema::bytes_view_t& key,
                     const T& value) const;

  bool contains(const tollbooth::schema::bytes_view_t& key) const;

  /// Apply all entries atomically and durably.
  void apply(const std::vector<write_entry_t>& entries) const;

  /// Apply entries atomically only if `guard` is absent. Returns false, and
  /// writes nothing, when it already existed.
  bool apply_if_absent(const tollbooth::schema::bytes_view_t& guard,
                       const std::vector<write_entry_t>& entries) const;

  /// Return at most `limit` key-value pairs sharing the provided key prefix,
  /// in key order.
  std::vector<key_value_entry_t> list_by_prefix(
      const tollbooth::schema::bytes_view_t& prefix,
      std::size_t limit = std::numeric_limits<std::size_t>::max()) const;

  /// Key-value pairs with begin <= key < end, in key order.
  std::vector<key_value_entry_t> list_range(
      const tollbooth::schema::bytes_view_t& begin,
      const tollbooth::schema::bytes_view_t& end) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace tollbooth::storage
