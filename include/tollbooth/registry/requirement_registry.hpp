#pragma once
#include <tollbooth/schema/error_code.hpp>
#include <tollbooth/schema/payment_requirement.hpp>
#include <tollbooth/storage/rocksdb/storage.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

namespace tollbooth::registry {

using declare_result_t =
    std::variant<tollbooth::schema::payment_requirement_t,
                 tollbooth::schema::failure>;

struct requirement_page final {
  std::vector<tollbooth::schema::payment_requirement_t> items;
  std::size_t total{0};
};

/// Declared payment requirements, keyed by (resource, scheme, network).
/// Entries are immutable: re-declaring identical content is a no-op, anything
/// else under the same key is refused. With a storage, every declaration is
/// written under REQ| before it becomes visible and the table is reloaded on
/// construction.
class requirement_registry final {
 public:
  static constexpr std::size_t kDefaultPageSize = 10;
  static constexpr std::size_t kMaxPageSize = 100;

  explicit requirement_registry(
      std::shared_ptr<const tollbooth::storage::rocksdb_storage_t> storage =
          nullptr);

  declare_result_t declare(tollbooth::schema::payment_requirement_t requirement);

  std::vector<tollbooth::schema::payment_requirement_t> lookup(
      std::string_view resource,
      std::string_view network) const;
  std::vector<tollbooth::schema::payment_requirement_t> lookup(
      std::string_view resource) const;
  std::vector<tollbooth::schema::payment_requirement_t> list() const;

  /// Entries in key order from `offset`; `limit` is clamped to 1..kMaxPageSize.
  requirement_page list(std::size_t offset,
                        std::size_t limit = kDefaultPageSize) const;

  std::size_t size() const;

 private:
  using key_t = std::tuple<std::string, uint8_t, std::string>;

  static key_t key_of(const tollbooth::schema::payment_requirement_t& requirement);

  std::shared_ptr<const tollbooth::storage::rocksdb_storage_t> storage_;
  mutable std::shared_mutex mutex_;
  std::map<key_t, tollbooth::schema::payment_requirement_t> entries_;
};

/// Shape checks a requirement must pass before it can be declared.
std::optional<tollbooth::schema::failure> validate(
    const tollbooth::schema::payment_requirement_t& requirement);

}  // namespace tollbooth::registry
