#include <tollbooth/storage/rocksdb/storage.hpp>

namespace tollbooth::storage {

namespace {

ROCKSDB_NAMESPACE::Options make_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  // A torn tail record means a reservation may have been lost; refuse to
  // start rather than silently drop it.
  options.wal_recovery_mode =
      ROCKSDB_NAMESPACE::WALRecoveryMode::kAbsoluteConsistency;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();
  return options;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  if (path.empty()) {
    throw storage_error{"database path is empty"};
  }

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(make_options(), std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("RocksDB open at {} failed: {}", path, status.ToString());
    throw storage_error{"open " + std::string{path} + ": " +
                        status.ToString()};
  }

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  spdlog::info("payment store ready at {}", path);
  return store;
}

}  // namespace tollbooth::storage
