#pragma once

#include <gtest/gtest.h>
#include <rocksdb/db.h>
#include <tollbooth/chain/adapter.hpp>
#include <tollbooth/chain/errors.hpp>
#include <tollbooth/crypto/signer.hpp>
#include <tollbooth/ledger/notification_sink.hpp>
#include <tollbooth/ledger/payment_ledger.hpp>
#include <tollbooth/replay/nonce_store.hpp>
#include <tollbooth/settlement/coordinator.hpp>
#include <tollbooth/testing/common.hpp>
#include <tollbooth/verification/ed25519_message.hpp>
#include <tollbooth/verification/signature_verifier.hpp>

#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tollbooth::testing {

inline constexpr auto kStartMs = uint64_t{1'700'000'000'000};

class manual_clock final {
 public:
  explicit manual_clock(const uint64_t start = kStartMs)
      : now_{std::make_shared<std::atomic<uint64_t>>(start)} {}

  std::function<uint64_t()> fn() const {
    return [now = now_] { return now->load(); };
  }

  uint64_t now() const { return now_->load(); }
  uint64_t now_seconds() const { return now_->load() / 1000; }
  void advance(const uint64_t ms) { now_->fetch_add(ms); }

 private:
  std::shared_ptr<std::atomic<uint64_t>> now_;
};

class recording_sink final : public tollbooth::ledger::notification_sink {
 public:
  void notify(const tollbooth::schema::settlement_notification_t& notification)
      override {
    auto lock = std::scoped_lock{mutex_};
    notifications_.push_back(notification);
  }

  std::vector<tollbooth::schema::settlement_notification_t> notifications()
      const {
    auto lock = std::scoped_lock{mutex_};
    return notifications_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<tollbooth::schema::settlement_notification_t> notifications_;
};

enum class fake_outcome : uint8_t { ok, unavailable, rejected };

/// In-memory chain. Submitted references report pending until a test scripts
/// another status for them.
class fake_adapter final : public tollbooth::chain::chain_adapter {
 public:
  explicit fake_adapter(std::vector<tollbooth::schema::network_t> networks,
                        const uint64_t confirmations = 1)
      : networks_{std::move(networks)}, confirmations_{confirmations} {}

  tollbooth::schema::chain_family family() const override {
    return networks_.empty() ? tollbooth::schema::chain_family::ed25519
                             : networks_.front().family;
  }

  std::vector<tollbooth::schema::network_t> networks() const override {
    return networks_;
  }

  bool supports(const tollbooth::schema::network_t& network) const override {
    for (const auto& entry : networks_) {
      if (entry == network) {
        return true;
      }
    }
    return false;
  }

  uint64_t required_confirmations(
      const tollbooth::schema::network_t&) const override {
    return confirmations_;
  }

  tollbooth::chain::fee_estimate estimate_fee(
      const tollbooth::schema::payment_requirement_t&) override {
    return {.amount = tollbooth::schema::amount_t{10'000}, .unit = "lamports"};
  }

  tollbooth::chain::prepared_transaction prepare(
      const tollbooth::schema::payment_authorization_t& authorization,
      const tollbooth::schema::payment_requirement_t&) override {
    auto outcome = fake_outcome::ok;
    std::function<void()> hook;
    {
      auto lock = std::scoped_lock{mutex_};
      ++prepare_calls_;
      if (!prepare_outcomes_.empty()) {
        outcome = prepare_outcomes_.front();
        prepare_outcomes_.pop_front();
      }
      hook = on_prepare_;
    }
    if (hook) {
      hook();
    }
    if (outcome == fake_outcome::unavailable) {
      throw tollbooth::chain::chain_unavailable{"blockhash unavailable"};
    }
    if (outcome == fake_outcome::rejected) {
      throw tollbooth::chain::chain_rejected{"account not found"};
    }
    return {.reference = "ref-" + tollbooth::schema::to_hex(authorization.nonce),
            .raw = authorization.signature};
  }

  tollbooth::schema::transaction_ref_t submit(
      const tollbooth::schema::network_t&,
      const tollbooth::chain::prepared_transaction& transaction) override {
    auto outcome = fake_outcome::ok;
    std::function<void()> hook;
    {
      auto lock = std::scoped_lock{mutex_};
      ++submit_calls_;
      if (!submit_outcomes_.empty()) {
        outcome = submit_outcomes_.front();
        submit_outcomes_.pop_front();
      }
      hook = on_submit_;
    }
    if (hook) {
      hook();
    }
    if (outcome == fake_outcome::unavailable) {
      throw tollbooth::chain::chain_unavailable{"node unreachable"};
    }
    if (outcome == fake_outcome::rejected) {
      throw tollbooth::chain::chain_rejected{"execution reverted"};
    }
    auto lock = std::scoped_lock{mutex_};
    ++successful_submits_;
    broadcast_.insert(transaction.reference);
    return transaction.reference;
  }

  tollbooth::chain::transaction_status_t status(
      const tollbooth::schema::network_t&,
      const tollbooth::schema::transaction_ref_t& reference) override {
    auto lock = std::scoped_lock{mutex_};
    ++status_calls_;
    if (!status_outcomes_.empty()) {
      auto outcome = status_outcomes_.front();
      status_outcomes_.pop_front();
      if (outcome == fake_outcome::unavailable) {
        throw tollbooth::chain::chain_unavailable{"node unreachable"};
      }
      if (outcome == fake_outcome::rejected) {
        throw tollbooth::chain::chain_rejected{"unknown method"};
      }
    }
    if (auto found = statuses_.find(reference); found != statuses_.end()) {
      return found->second;
    }
    if (broadcast_.contains(reference)) {
      return tollbooth::chain::tx_pending{};
    }
    return tollbooth::chain::tx_not_found{};
  }

  void script_prepares(std::initializer_list<fake_outcome> outcomes) {
    auto lock = std::scoped_lock{mutex_};
    prepare_outcomes_.insert(std::end(prepare_outcomes_), outcomes);
  }

  void script_submits(std::initializer_list<fake_outcome> outcomes) {
    auto lock = std::scoped_lock{mutex_};
    submit_outcomes_.insert(std::end(submit_outcomes_), outcomes);
  }

  void script_statuses(std::initializer_list<fake_outcome> outcomes) {
    auto lock = std::scoped_lock{mutex_};
    status_outcomes_.insert(std::end(status_outcomes_), outcomes);
  }

  void set_status(const std::string& reference,
                  tollbooth::chain::transaction_status_t status) {
    auto lock = std::scoped_lock{mutex_};
    statuses_[reference] = std::move(status);
  }

  /// Forgets a broadcast, as a node does when it drops a transaction.
  void drop(const std::string& reference) {
    auto lock = std::scoped_lock{mutex_};
    broadcast_.erase(reference);
    statuses_.erase(reference);
  }

  void on_submit(std::function<void()> hook) {
    auto lock = std::scoped_lock{mutex_};
    on_submit_ = std::move(hook);
  }

  void on_prepare(std::function<void()> hook) {
    auto lock = std::scoped_lock{mutex_};
    on_prepare_ = std::move(hook);
  }

  std::size_t prepare_calls() const {
    auto lock = std::scoped_lock{mutex_};
    return prepare_calls_;
  }
  std::size_t submit_calls() const {
    auto lock = std::scoped_lock{mutex_};
    return submit_calls_;
  }
  std::size_t successful_submits() const {
    auto lock = std::scoped_lock{mutex_};
    return successful_submits_;
  }
  std::size_t status_calls() const {
    auto lock = std::scoped_lock{mutex_};
    return status_calls_;
  }

 private:
  std::vector<tollbooth::schema::network_t> networks_;
  uint64_t confirmations_;
  mutable std::mutex mutex_;
  std::deque<fake_outcome> prepare_outcomes_;
  std::deque<fake_outcome> submit_outcomes_;
  std::deque<fake_outcome> status_outcomes_;
  std::map<std::string, tollbooth::chain::transaction_status_t> statuses_;
  std::set<std::string> broadcast_;
  std::function<void()> on_submit_;
  std::function<void()> on_prepare_;
  std::size_t prepare_calls_{0};
  std::size_t submit_calls_{0};
  std::size_t successful_submits_{0};
  std::size_t status_calls_{0};
};

inline tollbooth::schema::network_t devnet() {
  return *tollbooth::schema::try_make_network("solana-devnet");
}

inline tollbooth::schema::payment_requirement_t make_ed25519_requirement(
    const uint64_t max_amount,
    const uint64_t timeout_seconds = 60) {
  auto requirement = tollbooth::schema::payment_requirement_t{};
  requirement.scheme = tollbooth::schema::payment_scheme::exact;
  requirement.network = devnet();
  requirement.asset = make_address(0x40, 32);
  requirement.max_amount_required = max_amount;
  requirement.pay_to = make_address(0x20, 32);
  requirement.max_timeout_seconds = timeout_seconds;
  requirement.resource = "/weather";
  requirement.description = "current weather";
  requirement.mime_type = "application/json";
  return requirement;
}

inline std::optional<tollbooth::crypto::ed25519_signer> make_ed25519_payer(
    const uint8_t seed) {
  auto key = make_hash(seed);
  return tollbooth::crypto::ed25519_signer::from_seed(key);
}

/// Re-signs `authorization` for `requirement` with the payer's key.
inline void sign_ed25519(
    tollbooth::schema::payment_authorization_t& authorization,
    const tollbooth::schema::payment_requirement_t& requirement,
    const tollbooth::crypto::ed25519_signer& payer) {
  auto message =
      tollbooth::verification::make_ed25519_message(authorization, requirement);
  authorization.signature = payer.sign(message).value_or(
      tollbooth::schema::bytes_t{});
}

/// An authorization valid from 10 seconds before `now_seconds` until a minute
/// after it.
inline tollbooth::schema::payment_authorization_t make_ed25519_authorization(
    const tollbooth::crypto::ed25519_signer& payer,
    const tollbooth::schema::payment_requirement_t& requirement,
    const uint64_t amount,
    const uint64_t now_seconds,
    const uint8_t nonce_seed) {
  auto authorization = tollbooth::schema::payment_authorization_t{};
  authorization.scheme = requirement.scheme;
  authorization.network = requirement.network;
  authorization.payer = payer.public_key();
  authorization.payee = requirement.pay_to;
  authorization.amount = amount;
  authorization.valid_after = now_seconds - 10;
  authorization.valid_before = now_seconds + 60;
  authorization.nonce = make_hash(nonce_seed);
  sign_ed25519(authorization, requirement, payer);
  return authorization;
}

/// Coordinator over a fresh database, a fake Ed25519 chain and a manual
/// clock. Backoff sleeps are recorded instead of slept.
struct settlement_harness final {
  explicit settlement_harness(
      const std::string_view prefix,
      tollbooth::settlement::coordinator_options options = {})
      : db{prefix},
        options{options},
        sink{std::make_shared<recording_sink>()},
        adapter{std::make_shared<fake_adapter>(
            std::vector<tollbooth::schema::network_t>{devnet()})} {
    adapters.add(adapter);
    open();
  }

  void open() {
    storage = open_storage(db.path);
    nonces = std::make_unique<tollbooth::replay::nonce_store>(storage);
    ledger = std::make_unique<tollbooth::ledger::payment_ledger>(storage);
    coordinator = std::make_unique<tollbooth::settlement::coordinator>(
        verifier, *nonces, *ledger, adapters, *sink, options, clock.fn(),
        [this](const uint64_t delay) {
          auto lock = std::scoped_lock{sleeps_mutex};
          sleeps.push_back(delay);
        });
  }

  /// Closes and reopens the database, as a restarted process would.
  void reopen() {
    coordinator.reset();
    ledger.reset();
    nonces.reset();
    storage.reset();
    open();
  }

  /// Swaps in a read-only handle on the same files: reads keep working and
  /// every write fails, as on a full or failing disk.
  void make_read_only() {
    storage->database.reset();
    ROCKSDB_NAMESPACE::DB* database{nullptr};
    auto status = ROCKSDB_NAMESPACE::DB::OpenForReadOnly(
        ROCKSDB_NAMESPACE::Options{}, db.path, &database);
    EXPECT_TRUE(status.ok()) << status.ToString();
    storage->database.reset(database);
  }

  std::vector<uint64_t> recorded_sleeps() {
    auto lock = std::scoped_lock{sleeps_mutex};
    return sleeps;
  }

  scoped_path db;
  tollbooth::settlement::coordinator_options options;
  manual_clock clock;
  std::shared_ptr<recording_sink> sink;
  std::shared_ptr<fake_adapter> adapter;
  tollbooth::chain::adapter_set adapters;
  tollbooth::verification::signature_verifier verifier;
  std::shared_ptr<tollbooth::storage::rocksdb_storage_t> storage;
  std::unique_ptr<tollbooth::replay::nonce_store> nonces;
  std::unique_ptr<tollbooth::ledger::payment_ledger> ledger;
  std::unique_ptr<tollbooth::settlement::coordinator> coordinator;
  std::mutex sleeps_mutex;
  std::vector<uint64_t> sleeps;
};

}  // namespace tollbooth::testing
