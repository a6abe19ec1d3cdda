#pragma once
#include <tollbooth/schema/nonce_record.hpp>
#include <tollbooth/storage/rocksdb/storage.hpp>
#include <tollbooth/storage/storage.hpp>

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace tollbooth::replay {

enum class reservation_result : uint8_t {
  reserved = 0,
  already_reserved = 1,
};

/// Durable anti-replay set over (payer, network, nonce). Reservation is an
/// atomic check-and-set: of any number of concurrent callers exactly one sees
/// `reserved`. Each reservation also carries a time-ordered index entry until
/// the payment reaches submission, so the grace sweep reads only the
/// reservations still waiting.
class nonce_store final {
 public:
  explicit nonce_store(
      std::shared_ptr<const tollbooth::storage::rocksdb_storage_t> storage);

  reservation_result reserve(const tollbooth::schema::bytes_view_t& payer,
                             std::string_view network,
                             const tollbooth::schema::nonce_t& nonce,
                             tollbooth::schema::timestamp_milliseconds_t now);

  /// Read-only; never reserves.
  bool reserved(const tollbooth::schema::bytes_view_t& payer,
                std::string_view network,
                const tollbooth::schema::nonce_t& nonce) const;

  std::optional<tollbooth::schema::nonce_record_t> find(
      const tollbooth::schema::bytes_view_t& payer,
      std::string_view network,
      const tollbooth::schema::nonce_t& nonce) const;

  /// Releases a reservation so the authorization may be settled again.
  void expire(const tollbooth::schema::bytes_view_t& payer,
              std::string_view network,
              const tollbooth::schema::nonce_t& nonce);

  /// Batch entries that release a reservation and its index entry, for
  /// callers that must release in the same atomic write as another mutation.
  std::vector<tollbooth::storage::write_entry_t> release_entries(
      const tollbooth::schema::bytes_view_t& payer,
      std::string_view network,
      const tollbooth::schema::nonce_t& nonce) const;

  /// Batch entries that drop only the index entry; the nonce stays consumed.
  std::vector<tollbooth::storage::write_entry_t> unindex_entries(
      const tollbooth::schema::bytes_view_t& payer,
      std::string_view network,
      const tollbooth::schema::nonce_t& nonce) const;

  void unindex(const tollbooth::schema::bytes_view_t& payer,
               std::string_view network,
               const tollbooth::schema::nonce_t& nonce);

  /// Indexed reservations made strictly before `cutoff`, oldest first.
  std::vector<tollbooth::schema::nonce_record_t> reserved_before(
      tollbooth::schema::timestamp_milliseconds_t cutoff) const;

 private:
  std::shared_ptr<const tollbooth::storage::rocksdb_storage_t> storage_;
};

}  // namespace tollbooth::replay
