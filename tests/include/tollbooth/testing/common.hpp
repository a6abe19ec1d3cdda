#pragma once

#include <tollbooth/schema/primitives.hpp>
#include <tollbooth/storage/rocksdb/storage.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace tollbooth::testing {

inline tollbooth::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = tollbooth::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline tollbooth::schema::bytes_t make_address(const uint8_t seed,
                                               const std::size_t size) {
  auto out = tollbooth::schema::bytes_t(size);
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Removes the directory when it goes out of scope. Declare it before anything
/// that keeps the database open.
struct scoped_path final {
  explicit scoped_path(const std::string_view prefix)
      : path{make_db_path(prefix)} {}
  ~scoped_path() { remove_path(path); }

  scoped_path(const scoped_path&) = delete;
  scoped_path& operator=(const scoped_path&) = delete;

  std::string path;
};

inline std::shared_ptr<tollbooth::storage::rocksdb_storage_t> open_storage(
    const std::string& path) {
  return std::make_shared<tollbooth::storage::rocksdb_storage_t>(
      tollbooth::storage::make_storage<tollbooth::storage::rocksdb_storage_tag>(
          path));
}

}  // namespace tollbooth::testing
