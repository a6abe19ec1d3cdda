#include <tollbooth/chain/errors.hpp>
#include <tollbooth/schema/key/payment_record.hpp>
#include <tollbooth/settlement/coordinator.hpp>
#include <tollbooth/storage/storage.hpp>

#include <spdlog/spdlog.h>

using namespace tollbooth::schema;

namespace tollbooth::settlement {

namespace {

std::string short_id(const payment_id_t& id) {
  return to_hex(bytes_view_t{id.data(), 8});
}

settle_result make_failure_result(const payment_id_t& id,
                                  const payment_status status,
                                  const error_code code,
                                  std::string reason) {
  return settle_result{.payment_id = id,
                       .status = status,
                       .error = code,
                       .reason = std::move(reason)};
}

}  // namespace

settle_result make_settle_result(const payment_record_t& record) {
  return settle_result{.payment_id = record.id,
                       .status = record.status,
                       .transaction_ref = record.transaction_ref,
                       .confirmations = record.confirmations,
                       .attempts = record.attempts,
                       .error = record.failure_code,
                       .reason = record.failure_reason};
}

class coordinator::in_flight_guard final {
 public:
  in_flight_guard(coordinator& owner, const payment_id_t& id)
      : owner_{owner}, id_{id} {
    auto lock = std::scoped_lock{owner_.in_flight_mutex_};
    owner_.in_flight_.insert(id_);
  }

  ~in_flight_guard() {
    auto lock = std::scoped_lock{owner_.in_flight_mutex_};
    owner_.in_flight_.erase(id_);
  }

  in_flight_guard(const in_flight_guard&) = delete;
  in_flight_guard& operator=(const in_flight_guard&) = delete;

 private:
  coordinator& owner_;
  payment_id_t id_;
};

coordinator::coordinator(
    const tollbooth::verification::signature_verifier& verifier,
    tollbooth::replay::nonce_store& nonces,
    tollbooth::ledger::payment_ledger& ledger,
    const tollbooth::chain::adapter_set& adapters,
    tollbooth::ledger::notification_sink& sink,
    coordinator_options options,
    clock_fn clock,
    sleep_fn sleep)
    : verifier_{verifier},
      nonces_{nonces},
      ledger_{ledger},
      adapters_{adapters},
      sink_{sink},
      options_{std::move(options)},
      clock_{std::move(clock)},
      sleep_{std::move(sleep)} {}

std::mutex& coordinator::stripe(const payment_id_t& id) {
  return stripes_[id[0] % stripes_.size()];
}

bool coordinator::in_flight(const payment_id_t& id) const {
  auto lock = std::scoped_lock{in_flight_mutex_};
  return in_flight_.contains(id);
}

void coordinator::persist(payment_record_t& record,
                          const payment_status status,
                          std::vector<tollbooth::storage::write_entry_t> extra) {
  auto previous = record.status;
  record.status = status;
  record.updated_at = clock_();
  try {
    ledger_.record(record, std::move(extra));
  } catch (const tollbooth::storage::storage_error&) {
    record.status = previous;
    throw;
  }
  if (previous != status) {
    spdlog::info("payment {} {} -> {}", short_id(record.id),
                 to_string(previous), to_string(status));
  }
}

void coordinator::fail(payment_record_t& record,
                       const payment_status status,
                       const error_code code,
                       std::string reason,
                       const bool release_nonce) {
  record.failure_code = code;
  record.failure_reason = std::move(reason);
  auto extra = std::vector<tollbooth::storage::write_entry_t>{};
  if (release_nonce) {
    extra = nonces_.release_entries(record.authorization.payer,
                                    record.authorization.network.name,
                                    record.authorization.nonce);
  }
  persist(record, status, std::move(extra));
  notify(record);
}

void coordinator::notify(const payment_record_t& record) {
  if (!is_terminal(record.status)) {
    return;
  }
  sink_.notify(settlement_notification_t{
      .payment_id = record.id,
      .status = record.status,
      .transaction_ref = record.transaction_ref,
      .network = record.authorization.network.name,
      .reason = record.failure_reason,
      .created_at = record.created_at,
      .updated_at = record.updated_at});
}

settle_result coordinator::settle(
    const payment_authorization_t& authorization,
    const payment_requirement_t& requirement) {
  auto id = key::make_payment_id(authorization);
  auto now = clock_();
  auto record = payment_record_t{
      .id = id,
      .status = payment_status::requested,
      .requirement = requirement,
      .authorization = authorization,
      .created_at = now,
      .updated_at = now,
      .deadline = now + requirement.max_timeout_seconds * 1000};

  tollbooth::chain::chain_adapter* adapter = nullptr;
  auto guard = std::optional<in_flight_guard>{};
  {
    auto lock = std::scoped_lock{stripe(id)};
    try {
      auto existing = ledger_.find(id);
      if (existing && !is_restartable(existing->status)) {
        auto result = make_settle_result(*existing);
        result.error = error_code::duplicate_authorization;
        result.reason = "authorization already " +
                        std::string{to_string(existing->status)};
        return result;
      }
      if (existing) {
        record.attempts = existing->attempts;
        record.created_at = existing->created_at;
      }

      auto verified = verifier_.verify(authorization, requirement, now / 1000);
      if (auto* failed = std::get_if<failure>(&verified)) {
        fail(record, payment_status::rejected, failed->code, failed->reason,
             false);
        return make_settle_result(record);
      }
      record.status = payment_status::verified;

      adapter = adapters_.find(authorization.network);
      if (!adapter) {
        fail(record, payment_status::rejected, error_code::unsupported_network,
             "no adapter settles " + authorization.network.name, false);
        return make_settle_result(record);
      }

      if (nonces_.reserve(authorization.payer, authorization.network.name,
                          authorization.nonce, now) ==
          tollbooth::replay::reservation_result::already_reserved) {
        return make_failure_result(
            id, existing ? existing->status : payment_status::reserved,
            error_code::duplicate_authorization,
            "nonce already reserved");
      }

      record.failure_code = error_code::none;
      record.failure_reason.clear();
      try {
        persist(record, payment_status::reserved);
      } catch (const tollbooth::storage::storage_error&) {
        nonces_.expire(authorization.payer, authorization.network.name,
                       authorization.nonce);
        throw;
      }
      guard.emplace(*this, id);
    } catch (const tollbooth::storage::storage_error& e) {
      spdlog::error("settle {} aborted: {}", short_id(id), e.what());
      return make_failure_result(id, payment_status::requested,
                                 error_code::internal_error, e.what());
    }
  }
  return drive(std::move(record), *adapter);
}

settle_result coordinator::drive(payment_record_t record,
                                 tollbooth::chain::chain_adapter& adapter) {
  const auto& network = record.authorization.network;
  const auto& authorization = record.authorization;
  // A recovered submitting record may have been broadcast before the crash.
  auto broadcast_tried = record.transaction_ref.has_value();

  auto give_up_or_wait =
      [&](const std::string& reason) -> std::optional<settle_result> {
    if (record.attempts >= options_.retry.max_tries()) {
      spdlog::warn("payment {} gave up after {} tries: {}", short_id(record.id),
                   record.attempts, reason);
      if (!record.transaction_ref) {
        // Nothing was signed, so the authorization may be settled again.
        fail(record, payment_status::expired, error_code::chain_unavailable,
             reason, true);
      } else {
        fail(record, payment_status::settlement_timeout,
             error_code::settlement_timeout, reason, false);
      }
      return make_settle_result(record);
    }
    auto delay = options_.retry.delay_for(record.attempts + 1);
    spdlog::debug("payment {} try {} failed ({}), retrying in {}ms",
                  short_id(record.id), record.attempts, reason, delay);
    ledger_.record(record);
    sleep_(delay);
    return std::nullopt;
  };

  try {
    for (;;) {
      ++record.attempts;
      try {
        if (!record.transaction_ref) {
          auto fee = adapter.estimate_fee(record.requirement);
          auto prepared =
              adapter.prepare(record.authorization, record.requirement);
          record.fee = fee.amount;
          record.transaction_ref = prepared.reference;
          record.prepared = std::move(prepared.raw);
          persist(record, payment_status::submitting,
                  nonces_.unindex_entries(authorization.payer, network.name,
                                          authorization.nonce));
        } else {
          // The bytes may already be on chain; look before rebroadcasting.
          auto status = adapter.status(network, *record.transaction_ref);
          if (auto* failed = std::get_if<tollbooth::chain::tx_failed>(&status)) {
            fail(record, payment_status::submission_failed,
                 error_code::chain_rejected, failed->reason, true);
            return make_settle_result(record);
          }
          if (auto* confirmed =
                  std::get_if<tollbooth::chain::tx_confirmed>(&status)) {
            record.confirmations = confirmed->confirmations;
            persist(record, payment_status::confirming);
            return make_settle_result(record);
          }
          if (std::holds_alternative<tollbooth::chain::tx_pending>(status)) {
            persist(record, payment_status::submitted);
            return make_settle_result(record);
          }
        }

        adapter.submit(network, tollbooth::chain::prepared_transaction{
                                    .reference = *record.transaction_ref,
                                    .raw = record.prepared});
        persist(record, payment_status::submitted);
        return make_settle_result(record);
      } catch (const tollbooth::chain::chain_rejected& e) {
        if (!broadcast_tried) {
          spdlog::warn("payment {} rejected by {}: {}", short_id(record.id),
                       network.name, e.what());
          fail(record, payment_status::submission_failed,
               error_code::chain_rejected, e.what(), true);
          return make_settle_result(record);
        }
        // An earlier broadcast may still land; the nonce stays consumed.
        spdlog::warn("payment {} outcome unknown, {} refused a retry: {}",
                     short_id(record.id), network.name, e.what());
        if (auto result = give_up_or_wait(e.what())) {
          return *result;
        }
      } catch (const tollbooth::chain::chain_unavailable& e) {
        broadcast_tried = record.transaction_ref.has_value();
        if (auto result = give_up_or_wait(e.what())) {
          return *result;
        }
      }
    }
  } catch (const tollbooth::storage::storage_error& e) {
    spdlog::error("payment {} could not be persisted: {}", short_id(record.id),
                  e.what());
    auto result = make_settle_result(record);
    result.error = error_code::internal_error;
    result.reason = e.what();
    return result;
  }
}

bool coordinator::poll_one(payment_record_t& record,
                           tollbooth::chain::chain_adapter& adapter) {
  const auto& network = record.authorization.network;
  auto status = adapter.status(network, *record.transaction_ref);
  return std::visit(
      overloaded{
          [&](const tollbooth::chain::tx_pending&) {
            if (record.status == payment_status::submitting) {
              persist(record, payment_status::submitted);
              return true;
            }
            return false;
          },
          [&](const tollbooth::chain::tx_confirmed& confirmed) {
            auto required = adapter.required_confirmations(network);
            if (confirmed.confirmations >= required) {
              record.confirmations = confirmed.confirmations;
              record.failure_code = error_code::none;
              record.failure_reason.clear();
              persist(record, payment_status::settled);
              notify(record);
              return true;
            }
            if (record.confirmations == confirmed.confirmations &&
                record.status != payment_status::submitting &&
                record.status != payment_status::submitted) {
              return false;
            }
            record.confirmations = confirmed.confirmations;
            persist(record,
                    record.status == payment_status::settlement_timeout
                        ? payment_status::settlement_timeout
                        : payment_status::confirming);
            return true;
          },
          [&](const tollbooth::chain::tx_failed& failed) {
            fail(record, payment_status::submission_failed,
                 error_code::chain_rejected, failed.reason, true);
            return true;
          },
          [&](const tollbooth::chain::tx_not_found&) {
            if (record.status == payment_status::settlement_timeout) {
              return false;
            }
            if (record.attempts >= options_.retry.max_tries()) {
              fail(record, payment_status::settlement_timeout,
                   error_code::settlement_timeout,
                   "transaction not found after " +
                       std::to_string(record.attempts) + " broadcasts",
                   false);
              return true;
            }
            ++record.attempts;
            ledger_.record(record);
            spdlog::info("payment {} not seen on {}, rebroadcasting",
                         short_id(record.id), network.name);
            adapter.submit(network, tollbooth::chain::prepared_transaction{
                                        .reference = *record.transaction_ref,
                                        .raw = record.prepared});
            persist(record, payment_status::submitted);
            return true;
          },
      },
      status);
}

std::size_t coordinator::poll_confirmations() {
  auto changed = std::size_t{0};
  auto now = clock_();
  for (const auto& id : ledger_.open_ids()) {
    auto lock = std::scoped_lock{stripe(id)};
    if (in_flight(id)) {
      continue;
    }
    try {
      auto record = ledger_.find(id);
      if (!record) {
        continue;
      }
      if (record->status == payment_status::settlement_timeout &&
          now > record->deadline + options_.timeout_retention) {
        spdlog::info("payment {} retired after {}ms in settlement_timeout",
                     short_id(id), now - record->deadline);
        ledger_.retire(*record);
        ++changed;
        continue;
      }
      if (!record->transaction_ref) {
        continue;
      }
      switch (record->status) {
        case payment_status::submitting:
        case payment_status::submitted:
        case payment_status::confirming:
        case payment_status::settlement_timeout:
          break;
        default:
          continue;
      }
      auto* adapter = adapters_.find(record->authorization.network);
      if (!adapter) {
        spdlog::warn("payment {} on unconfigured network {}", short_id(id),
                     record->authorization.network.name);
        continue;
      }
      if (poll_one(*record, *adapter)) {
        ++changed;
      }
    } catch (const tollbooth::chain::chain_unavailable& e) {
      spdlog::debug("poll of {} deferred: {}", short_id(id), e.what());
    } catch (const tollbooth::chain::chain_rejected& e) {
      spdlog::warn("poll of {} refused: {}", short_id(id), e.what());
    } catch (const tollbooth::storage::storage_error& e) {
      spdlog::error("poll of {} failed: {}", short_id(id), e.what());
    }
  }
  return changed;
}

std::size_t coordinator::sweep_timeouts() {
  auto changed = std::size_t{0};
  auto now = clock_();
  for (const auto& id : ledger_.open_ids()) {
    auto lock = std::scoped_lock{stripe(id)};
    if (in_flight(id)) {
      continue;
    }
    try {
      auto record = ledger_.find(id);
      if (!record || now <= record->deadline) {
        continue;
      }
      switch (record->status) {
        case payment_status::submitting:
        case payment_status::submitted:
        case payment_status::confirming:
          break;
        default:
          continue;
      }
      fail(*record, payment_status::settlement_timeout,
           error_code::settlement_timeout, "no confirmation before deadline",
           false);
      ++changed;
    } catch (const tollbooth::storage::storage_error& e) {
      spdlog::error("timeout sweep of {} failed: {}", short_id(id), e.what());
    }
  }
  return changed;
}

std::size_t coordinator::sweep_reservations() {
  auto changed = std::size_t{0};
  auto now = clock_();
  auto cutoff = now > options_.reservation_grace
                    ? now - options_.reservation_grace
                    : timestamp_milliseconds_t{0};
  for (const auto& reservation : nonces_.reserved_before(cutoff)) {
    auto id = key::make_payment_id(reservation.payer, reservation.network,
                                   reservation.nonce);
    auto lock = std::scoped_lock{stripe(id)};
    if (in_flight(id)) {
      continue;
    }
    try {
      auto record = ledger_.find(id);
      if (!record) {
        spdlog::info("releasing orphaned reservation {}", short_id(id));
        nonces_.expire(reservation.payer, reservation.network,
                       reservation.nonce);
        ++changed;
        continue;
      }
      if (record->status != payment_status::reserved) {
        nonces_.unindex(reservation.payer, reservation.network,
                        reservation.nonce);
        continue;
      }
      fail(*record, payment_status::expired, error_code::none,
           "reservation never reached submission", true);
      ++changed;
    } catch (const tollbooth::storage::storage_error& e) {
      spdlog::error("reservation sweep of {} failed: {}", short_id(id),
                    e.what());
    }
  }
  return changed;
}

std::size_t coordinator::recover() {
  auto resumed = std::size_t{0};
  for (const auto& id : ledger_.open_ids()) {
    auto record = std::optional<payment_record_t>{};
    tollbooth::chain::chain_adapter* adapter = nullptr;
    auto guard = std::optional<in_flight_guard>{};
    {
      auto lock = std::scoped_lock{stripe(id)};
      if (in_flight(id)) {
        continue;
      }
      record = ledger_.find(id);
      if (!record || (record->status != payment_status::reserved &&
                      record->status != payment_status::submitting)) {
        continue;
      }
      adapter = adapters_.find(record->authorization.network);
      if (!adapter) {
        spdlog::warn("cannot resume {}: network {} not configured",
                     short_id(id), record->authorization.network.name);
        continue;
      }
      guard.emplace(*this, id);
    }
    spdlog::info("resuming payment {} from {}", short_id(id),
                 to_string(record->status));
    auto result = drive(std::move(*record), *adapter);
    spdlog::info("payment {} resumed as {}", short_id(id),
                 to_string(result.status));
    ++resumed;
  }
  return resumed;
}

}  // namespace tollbooth::settlement
