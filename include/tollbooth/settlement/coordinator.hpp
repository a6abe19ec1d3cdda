#pragma once
#include <tollbooth/chain/adapter.hpp>
#include <tollbooth/ledger/notification_sink.hpp>
#include <tollbooth/ledger/payment_ledger.hpp>
#include <tollbooth/replay/nonce_store.hpp>
#include <tollbooth/schema/payment_record.hpp>
#include <tollbooth/settlement/retry_policy.hpp>
#include <tollbooth/verification/signature_verifier.hpp>

#include <array>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace tollbooth::settlement {

struct coordinator_options final {
  retry_policy retry;
  // Reservations that never reach submitting within this window are expired.
  tollbooth::schema::duration_milliseconds_t reservation_grace{120'000};
  // Timed out records are polled this long past their deadline, then retired.
  tollbooth::schema::duration_milliseconds_t timeout_retention{86'400'000};
};

struct settle_result final {
  tollbooth::schema::payment_id_t payment_id{};
  tollbooth::schema::payment_status status{
      tollbooth::schema::payment_status::requested};
  std::optional<tollbooth::schema::transaction_ref_t> transaction_ref;
  uint64_t confirmations{0};
  uint32_t attempts{0};
  tollbooth::schema::error_code error{tollbooth::schema::error_code::none};
  std::string reason;
};

/// Owns the payment state machine and is the only writer of payment records.
///
/// settle() verifies, reserves the nonce, persists the record and drives the
/// submission loop on the calling thread. The background passes
/// (poll_confirmations, sweep_timeouts, sweep_reservations) pick up whatever
/// no settle() call is currently driving.
class coordinator final {
 public:
  using clock_fn = std::function<tollbooth::schema::timestamp_milliseconds_t()>;
  using sleep_fn = std::function<void(tollbooth::schema::duration_milliseconds_t)>;

  coordinator(const tollbooth::verification::signature_verifier& verifier,
              tollbooth::replay::nonce_store& nonces,
              tollbooth::ledger::payment_ledger& ledger,
              const tollbooth::chain::adapter_set& adapters,
              tollbooth::ledger::notification_sink& sink,
              coordinator_options options,
              clock_fn clock,
              sleep_fn sleep);

  settle_result settle(
      const tollbooth::schema::payment_authorization_t& authorization,
      const tollbooth::schema::payment_requirement_t& requirement);

  /// Advances submitted records towards settled, rebroadcasting dropped
  /// transactions. Timed out records past their retention window are retired
  /// from the open index. Returns the number of records that changed.
  std::size_t poll_confirmations();

  /// Moves records past their deadline to settlement_timeout.
  std::size_t sweep_timeouts();

  /// Expires reservations older than the grace period that never reached
  /// submitting, releasing their nonces.
  std::size_t sweep_reservations();

  /// Resumes reserved and submitting records left behind by a previous
  /// process. Submitting records are looked up on chain before any
  /// rebroadcast.
  std::size_t recover();

 private:
  class in_flight_guard;

  std::mutex& stripe(const tollbooth::schema::payment_id_t& id);
  bool in_flight(const tollbooth::schema::payment_id_t& id) const;

  settle_result drive(tollbooth::schema::payment_record_t record,
                      tollbooth::chain::chain_adapter& adapter);
  bool poll_one(tollbooth::schema::payment_record_t& record,
                tollbooth::chain::chain_adapter& adapter);

  void persist(tollbooth::schema::payment_record_t& record,
               tollbooth::schema::payment_status status,
               std::vector<tollbooth::storage::write_entry_t> extra = {});
  void fail(tollbooth::schema::payment_record_t& record,
            tollbooth::schema::payment_status status,
            tollbooth::schema::error_code code,
            std::string reason,
            bool release_nonce);
  void notify(const tollbooth::schema::payment_record_t& record);

  const tollbooth::verification::signature_verifier& verifier_;
  tollbooth::replay::nonce_store& nonces_;
  tollbooth::ledger::payment_ledger& ledger_;
  const tollbooth::chain::adapter_set& adapters_;
  tollbooth::ledger::notification_sink& sink_;
  coordinator_options options_;
  clock_fn clock_;
  sleep_fn sleep_;

  std::array<std::mutex, 64> stripes_;
  mutable std::mutex in_flight_mutex_;
  std::set<tollbooth::schema::payment_id_t> in_flight_;
};

settle_result make_settle_result(
    const tollbooth::schema::payment_record_t& record);

}  // namespace tollbooth::settlement
