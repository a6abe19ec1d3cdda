#pragma once
#include <tollbooth/schema/payment_record.hpp>
#include <tollbooth/storage/rocksdb/storage.hpp>
#include <tollbooth/storage/storage.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace tollbooth::ledger {

/// Records the background tasks still have to look at: everything between
/// reservation and settlement, plus timed out records that may yet confirm.
bool is_open(tollbooth::schema::payment_status status);

/// Durable record of every payment's lifecycle. Written only by the
/// settlement coordinator; read by everyone.
class payment_ledger final {
 public:
  explicit payment_ledger(
      std::shared_ptr<const tollbooth::storage::rocksdb_storage_t> storage);

  std::optional<tollbooth::schema::payment_record_t> find(
      const tollbooth::schema::payment_id_t& id) const;

  std::vector<tollbooth::schema::payment_record_t> list() const;

  /// Ids whose status satisfies is_open.
  std::vector<tollbooth::schema::payment_id_t> open_ids() const;

  /// Records paid by `payer`, newest first.
  std::vector<tollbooth::schema::payment_record_t> by_payer(
      const tollbooth::schema::bytes_view_t& payer,
      std::size_t limit = kDefaultQueryLimit) const;

  /// Records paid to `payee`, newest first.
  std::vector<tollbooth::schema::payment_record_t> by_payee(
      const tollbooth::schema::bytes_view_t& payee,
      std::size_t limit = kDefaultQueryLimit) const;

  /// Persists the record with its open and party index entries, plus
  /// `extra`, in one synchronous atomic write.
  void record(const tollbooth::schema::payment_record_t& record,
              std::vector<tollbooth::storage::write_entry_t> extra = {});

  /// Persists the record and drops it from the open index whatever its
  /// status, so background tasks stop looking at it.
  void retire(const tollbooth::schema::payment_record_t& record);

  static constexpr std::size_t kDefaultQueryLimit = 100;

 private:
  std::vector<tollbooth::schema::payment_record_t> by_party(
      std::string_view index,
      const tollbooth::schema::bytes_view_t& party,
      std::size_t limit) const;
  void write(const tollbooth::schema::payment_record_t& record,
             bool open,
             std::vector<tollbooth::storage::write_entry_t> extra);

  std::shared_ptr<const tollbooth::storage::rocksdb_storage_t> storage_;
};

}  // namespace tollbooth::ledger
