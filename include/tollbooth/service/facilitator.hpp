#pragma once
#include <tollbooth/chain/adapter.hpp>
#include <tollbooth/ledger/notification_sink.hpp>
#include <tollbooth/ledger/payment_ledger.hpp>
#include <tollbooth/registry/requirement_registry.hpp>
#include <tollbooth/replay/nonce_store.hpp>
#include <tollbooth/settlement/coordinator.hpp>
#include <tollbooth/settlement/scheduler.hpp>
#include <tollbooth/storage/rocksdb/storage.hpp>
#include <tollbooth/verification/signature_verifier.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace tollbooth::service {

struct verify_response final {
  bool valid{false};
  std::optional<tollbooth::schema::address_t> payer;
  tollbooth::schema::error_code error{tollbooth::schema::error_code::none};
  std::string reason;
};

struct supported_kind final {
  tollbooth::schema::payment_scheme scheme{
      tollbooth::schema::payment_scheme::exact};
  tollbooth::schema::network_t network;
};

struct facilitator_options final {
  tollbooth::settlement::coordinator_options settlement;
  std::chrono::milliseconds poll_interval{2'000};
  std::chrono::milliseconds sweep_interval{5'000};
};

/// One facilitator instance: registry, verifier, nonce store, ledger, chain
/// adapters and the settlement coordinator over a single database.
class facilitator final {
 public:
  using clock_fn = tollbooth::settlement::coordinator::clock_fn;
  using sleep_fn = tollbooth::settlement::coordinator::sleep_fn;

  facilitator(
      std::shared_ptr<const tollbooth::storage::rocksdb_storage_t> storage,
      tollbooth::chain::adapter_set adapters,
      std::shared_ptr<tollbooth::ledger::notification_sink> sink,
      facilitator_options options,
      std::shared_ptr<const tollbooth::verification::pricing_oracle> oracle =
          nullptr,
      clock_fn clock = nullptr,
      sleep_fn sleep = nullptr);

  facilitator(const facilitator&) = delete;
  facilitator& operator=(const facilitator&) = delete;

  /// Checks without reserving. An authorization whose nonce is already
  /// reserved is reported as a duplicate.
  verify_response verify(
      const tollbooth::schema::payment_authorization_t& authorization,
      const tollbooth::schema::payment_requirement_t& requirement) const;

  tollbooth::settlement::settle_result settle(
      const tollbooth::schema::payment_authorization_t& authorization,
      const tollbooth::schema::payment_requirement_t& requirement);

  std::optional<tollbooth::schema::payment_record_t> payment(
      const tollbooth::schema::payment_id_t& id) const;

  /// Newest first.
  std::vector<tollbooth::schema::payment_record_t> payments_by_payer(
      const tollbooth::schema::address_t& payer,
      std::size_t limit = tollbooth::ledger::payment_ledger::kDefaultQueryLimit)
      const;
  std::vector<tollbooth::schema::payment_record_t> payments_by_payee(
      const tollbooth::schema::address_t& payee,
      std::size_t limit = tollbooth::ledger::payment_ledger::kDefaultQueryLimit)
      const;

  std::vector<supported_kind> supported() const;

  tollbooth::registry::declare_result_t declare(
      tollbooth::schema::payment_requirement_t requirement);
  /// Every network when `network` is empty.
  std::vector<tollbooth::schema::payment_requirement_t> lookup(
      std::string_view resource,
      std::string_view network) const;
  tollbooth::registry::requirement_page list_requirements(
      std::size_t offset,
      std::size_t limit =
          tollbooth::registry::requirement_registry::kDefaultPageSize) const;

  /// Configured networks first, then the built-in table.
  std::optional<tollbooth::schema::network_t> resolve_network(
      std::string_view name) const;

  std::size_t recover();

  /// Registers confirmation polling and both sweeps.
  void start(tollbooth::settlement::scheduler& scheduler);

  tollbooth::settlement::coordinator& settlement_coordinator() {
    return coordinator_;
  }

 private:
  std::shared_ptr<const tollbooth::storage::rocksdb_storage_t> storage_;
  tollbooth::chain::adapter_set adapters_;
  std::shared_ptr<tollbooth::ledger::notification_sink> sink_;
  facilitator_options options_;
  std::shared_ptr<const tollbooth::verification::pricing_oracle> oracle_;
  clock_fn clock_;

  tollbooth::registry::requirement_registry registry_;
  tollbooth::verification::signature_verifier verifier_;
  tollbooth::replay::nonce_store nonces_;
  tollbooth::ledger::payment_ledger ledger_;
  tollbooth::settlement::coordinator coordinator_;
};

/// Milliseconds since the unix epoch.
tollbooth::schema::timestamp_milliseconds_t system_clock_ms();

}  // namespace tollbooth::service
