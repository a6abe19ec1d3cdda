#include <tollbooth/service/facilitator.hpp>

#include <spdlog/spdlog.h>

#include <thread>

using namespace tollbooth::schema;

namespace tollbooth::service {

timestamp_milliseconds_t system_clock_ms() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

namespace {

facilitator::clock_fn or_system_clock(facilitator::clock_fn clock) {
  if (clock) {
    return clock;
  }
  return [] { return system_clock_ms(); };
}

facilitator::sleep_fn or_thread_sleep(facilitator::sleep_fn sleep) {
  if (sleep) {
    return sleep;
  }
  return [](const duration_milliseconds_t delay) {
    std::this_thread::sleep_for(std::chrono::milliseconds{delay});
  };
}

}  // namespace

facilitator::facilitator(
    std::shared_ptr<const tollbooth::storage::rocksdb_storage_t> storage,
    tollbooth::chain::adapter_set adapters,
    std::shared_ptr<tollbooth::ledger::notification_sink> sink,
    facilitator_options options,
    std::shared_ptr<const tollbooth::verification::pricing_oracle> oracle,
    clock_fn clock,
    sleep_fn sleep)
    : storage_{std::move(storage)},
      adapters_{std::move(adapters)},
      sink_{sink ? std::move(sink)
                 : std::make_shared<tollbooth::ledger::logging_notification_sink>()},
      options_{std::move(options)},
      oracle_{std::move(oracle)},
      clock_{or_system_clock(std::move(clock))},
      registry_{storage_},
      verifier_{oracle_},
      nonces_{storage_},
      ledger_{storage_},
      coordinator_{verifier_,
                   nonces_,
                   ledger_,
                   adapters_,
                   *sink_,
                   options_.settlement,
                   clock_,
                   or_thread_sleep(std::move(sleep))} {}

verify_response facilitator::verify(
    const payment_authorization_t& authorization,
    const payment_requirement_t& requirement) const {
  auto result = verifier_.verify(authorization, requirement, clock_() / 1000);
  if (auto* failed = std::get_if<failure>(&result)) {
    return verify_response{.error = failed->code, .reason = failed->reason};
  }
  if (!adapters_.find(authorization.network)) {
    return verify_response{
        .error = error_code::unsupported_network,
        .reason = "no adapter settles " + authorization.network.name};
  }
  if (nonces_.reserved(authorization.payer, authorization.network.name,
                       authorization.nonce)) {
    return verify_response{.error = error_code::duplicate_authorization,
                           .reason = "nonce already reserved"};
  }
  return verify_response{
      .valid = true,
      .payer = std::get<tollbooth::verification::verified_payer>(result).payer};
}

tollbooth::settlement::settle_result facilitator::settle(
    const payment_authorization_t& authorization,
    const payment_requirement_t& requirement) {
  return coordinator_.settle(authorization, requirement);
}

std::optional<payment_record_t> facilitator::payment(
    const payment_id_t& id) const {
  return ledger_.find(id);
}

std::vector<payment_record_t> facilitator::payments_by_payer(
    const address_t& payer,
    const std::size_t limit) const {
  return ledger_.by_payer(make_bytes_view(payer), limit);
}

std::vector<payment_record_t> facilitator::payments_by_payee(
    const address_t& payee,
    const std::size_t limit) const {
  return ledger_.by_payee(make_bytes_view(payee), limit);
}

std::vector<supported_kind> facilitator::supported() const {
  auto out = std::vector<supported_kind>{};
  for (const auto& network : adapters_.networks()) {
    out.push_back({payment_scheme::exact, network});
    out.push_back({payment_scheme::upto, network});
    if (oracle_) {
      out.push_back({payment_scheme::dynamic, network});
    }
  }
  return out;
}

tollbooth::registry::declare_result_t facilitator::declare(
    payment_requirement_t requirement) {
  return registry_.declare(std::move(requirement));
}

std::vector<payment_requirement_t> facilitator::lookup(
    const std::string_view resource,
    const std::string_view network) const {
  if (network.empty()) {
    return registry_.lookup(resource);
  }
  return registry_.lookup(resource, network);
}

tollbooth::registry::requirement_page facilitator::list_requirements(
    const std::size_t offset,
    const std::size_t limit) const {
  return registry_.list(offset, limit);
}

std::optional<network_t> facilitator::resolve_network(
    const std::string_view name) const {
  for (const auto& network : adapters_.networks()) {
    if (network.name == name) {
      return network;
    }
  }
  return try_make_network(name);
}

std::size_t facilitator::recover() {
  auto resumed = coordinator_.recover();
  if (resumed > 0) {
    spdlog::info("resumed {} in-flight payments", resumed);
  }
  return resumed;
}

void facilitator::start(tollbooth::settlement::scheduler& scheduler) {
  scheduler.schedule("confirmations", options_.poll_interval,
                     [this] { coordinator_.poll_confirmations(); });
  scheduler.schedule("timeouts", options_.sweep_interval,
                     [this] { coordinator_.sweep_timeouts(); });
  scheduler.schedule("reservations", options_.sweep_interval,
                     [this] { coordinator_.sweep_reservations(); });
}

}  // namespace tollbooth::service
