#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <tollbooth/schema/encoding/scale/encoder.hpp>
#include <tollbooth/storage/storage.hpp>
#include <cstddef>
#include <iterator>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace tollbooth::storage {

namespace detail {

using encoder_t = tollbooth::schema::encoding::encoder<
    tollbooth::schema::encoding::scale_encoder_tag>;

inline tollbooth::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const tollbooth::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline ROCKSDB_NAMESPACE::WriteOptions durable_write_options() {
  auto options = ROCKSDB_NAMESPACE::WriteOptions{};
  options.sync = true;
  return options;
}

inline void check_write(const ROCKSDB_NAMESPACE::Status& status,
                        const std::string_view what) {
  if (!status.ok()) {
    spdlog::error("RocksDB {} failed: {}", what, status.ToString());
    throw storage_error{std::string{what} + ": " + status.ToString()};
  }
}

inline ROCKSDB_NAMESPACE::WriteBatch make_batch(
    const std::vector<write_entry_t>& entries) {
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    if (value) {
      check_write(batch.Put(to_slice(key), to_slice(*value)), "batch put");
    } else {
      check_write(batch.Delete(to_slice(key)), "batch delete");
    }
  }
  return batch;
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;
  // Serializes writers so put_if_absent is a true check-and-set.
  std::unique_ptr<std::mutex> write_mutex{std::make_unique<std::mutex>()};

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const tollbooth::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const tollbooth::schema::bytes_view_t& key,
           const T& value) const;

  template <typename T, typename Encoder>
  bool put_if_absent(Encoder& encoder,
                     const tollbooth::schema::bytes_view_t& key,
                     const T& value) const;

  bool contains(const tollbooth::schema::bytes_view_t& key) const;
  void apply(const std::vector<write_entry_t>& entries) const;
  bool apply_if_absent(const tollbooth::schema::bytes_view_t& guard,
                       const std::vector<write_entry_t>& entries) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const tollbooth::schema::bytes_view_t& prefix,
      std::size_t limit = std::numeric_limits<std::size_t>::max()) const;
  std::vector<key_value_entry_t> list_range(
      const tollbooth::schema::bytes_view_t& begin,
      const tollbooth::schema::bytes_view_t& end) const;

 private:
  std::optional<std::string> get_raw(
      const tollbooth::schema::bytes_view_t& key) const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<std::string> storage<rocksdb_storage_tag>::get_raw(
    const tollbooth::schema::bytes_view_t& key) const {
  if (!database) {
    throw storage_error{"RocksDB database is not initialized"};
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    throw storage_error{"get failed: " + status.ToString()};
  }
  return value;
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const tollbooth::schema::bytes_view_t& key) const {
  auto value = get_raw(key);
  if (!value) {
    return std::nullopt;
  }
  auto decoded = encoder.template try_decode<T>(tollbooth::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value->data()), value->size()});
  if (!decoded) {
    throw storage_error{"stored value failed to decode"};
  }
  return decoded;
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const tollbooth::schema::bytes_view_t& key,
    const T& value) const {
  if (!database) {
    throw storage_error{"RocksDB database is not initialized"};
  }
  auto encoded_value = encoder.encode(value);
  auto lock = std::scoped_lock{*write_mutex};
  detail::check_write(
      database->Put(detail::durable_write_options(), detail::to_slice(key),
                    detail::to_slice(encoded_value)),
      "put");
}

template <typename T, typename Encoder>
bool storage<rocksdb_storage_tag>::put_if_absent(
    Encoder& encoder,
    const tollbooth::schema::bytes_view_t& key,
    const T& value) const {
  if (!database) {
    throw storage_error{"RocksDB database is not initialized"};
  }
  auto encoded_value = encoder.encode(value);
  auto lock = std::scoped_lock{*write_mutex};
  if (get_raw(key)) {
    return false;
  }
  detail::check_write(
      database->Put(detail::durable_write_options(), detail::to_slice(key),
                    detail::to_slice(encoded_value)),
      "put_if_absent");
  return true;
}

inline bool storage<rocksdb_storage_tag>::contains(
    const tollbooth::schema::bytes_view_t& key) const {
  return get_raw(key).has_value();
}

inline void storage<rocksdb_storage_tag>::apply(
    const std::vector<write_entry_t>& entries) const {
  if (!database) {
    throw storage_error{"RocksDB database is not initialized"};
  }
  auto batch = detail::make_batch(entries);
  auto lock = std::scoped_lock{*write_mutex};
  detail::check_write(database->Write(detail::durable_write_options(), &batch),
                      "batch commit");
}

inline bool storage<rocksdb_storage_tag>::apply_if_absent(
    const tollbooth::schema::bytes_view_t& guard,
    const std::vector<write_entry_t>& entries) const {
  if (!database) {
    throw storage_error{"RocksDB database is not initialized"};
  }
  auto batch = detail::make_batch(entries);
  auto lock = std::scoped_lock{*write_mutex};
  if (get_raw(guard)) {
    return false;
  }
  detail::check_write(database->Write(detail::durable_write_options(), &batch),
                      "guarded batch commit");
  return true;
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const tollbooth::schema::bytes_view_t& prefix,
    const std::size_t limit) const {
  if (!database) {
    throw storage_error{"RocksDB database is not initialized"};
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid() && entries.size() < limit) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    throw storage_error{"prefix scan failed: " +
                        iterator->status().ToString()};
  }
  return entries;
}

inline std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_range(
    const tollbooth::schema::bytes_view_t& begin,
    const tollbooth::schema::bytes_view_t& end) const {
  if (!database) {
    throw storage_error{"RocksDB database is not initialized"};
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto upper = detail::to_slice(end);
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  read_options.iterate_upper_bound = &upper;
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  for (iterator->Seek(detail::to_slice(begin)); iterator->Valid();
       iterator->Next()) {
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    throw storage_error{"range scan failed: " + iterator->status().ToString()};
  }
  return entries;
}

}  // namespace tollbooth::storage
