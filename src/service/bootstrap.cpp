#include <tollbooth/chain/ed25519_adapter.hpp>
#include <tollbooth/chain/evm_adapter.hpp>
#include <tollbooth/chain/http_endpoint.hpp>
#include <tollbooth/common/critical.hpp>
#include <tollbooth/crypto/verify.hpp>
#include <tollbooth/service/bootstrap.hpp>

#include <spdlog/spdlog.h>

using namespace tollbooth::schema;

namespace tollbooth::service {

namespace {

const std::string& family_key(
    const std::vector<tollbooth::config::network_config>& networks,
    const chain_family family) {
  const std::string* key = nullptr;
  for (const auto& network : networks) {
    if (network.network.family != family) {
      continue;
    }
    if (network.signer_key.empty()) {
      tollbooth::common::critical("network {} has no signer_key",
                                  network.network.name);
    }
    if (key && *key != network.signer_key) {
      tollbooth::common::critical(
          "all {} networks must share one signer_key ({} differs)",
          to_string(family), network.network.name);
    }
    key = &network.signer_key;
  }
  return *key;
}

bytes_t decode_key(const std::string& hex, const chain_family family) {
  auto bytes = try_from_hex(hex);
  if (!bytes || bytes->size() != 32) {
    tollbooth::common::critical("{} signer_key must be 32 bytes of hex",
                                to_string(family));
  }
  return std::move(*bytes);
}

tollbooth::chain::network_binding make_binding(
    const tollbooth::config::network_config& network,
    const tollbooth::chain::circuit_breaker::clock_fn& clock) {
  auto endpoints = std::vector<std::shared_ptr<tollbooth::chain::endpoint>>{};
  for (const auto& url : network.rpc) {
    endpoints.push_back(std::make_shared<tollbooth::chain::http_endpoint>(
        url, network.rpc_timeout_ms));
  }
  auto pool = std::make_shared<tollbooth::chain::endpoint_pool>(
      network.network.name, std::move(endpoints),
      tollbooth::chain::breaker_options{
          .failure_threshold = network.breaker_failures,
          .cooldown = network.breaker_cooldown_ms},
      clock);
  spdlog::info("network {} ({} chain {}): {} endpoint(s), {} confirmation(s)",
               network.network.name, to_string(network.network.family),
               network.network.chain_id, network.rpc.size(),
               network.confirmations);
  return tollbooth::chain::network_binding{
      .network = network.network,
      .required_confirmations = network.confirmations,
      .pool = std::move(pool),
      .fee_multiplier = network.gas_multiplier};
}

}  // namespace

std::vector<std::string> unusable_networks(
    const std::vector<tollbooth::config::network_config>& networks) {
  auto out = std::vector<std::string>{};
  if (tollbooth::crypto::keccak_available()) {
    return out;
  }
  for (const auto& network : networks) {
    if (network.network.family == chain_family::evm) {
      out.push_back(network.network.name);
    }
  }
  return out;
}

tollbooth::chain::adapter_set make_adapters(
    const std::vector<tollbooth::config::network_config>& networks,
    tollbooth::chain::circuit_breaker::clock_fn clock) {
  if (auto unusable = unusable_networks(networks); !unusable.empty()) {
    tollbooth::common::critical(
        "evm network {} needs Keccak-256, which this OpenSSL lacks (3.2+)",
        unusable.front());
  }

  auto evm = std::vector<tollbooth::chain::network_binding>{};
  auto ed25519 = std::vector<tollbooth::chain::network_binding>{};
  for (const auto& network : networks) {
    auto& bindings =
        network.network.family == chain_family::evm ? evm : ed25519;
    bindings.push_back(make_binding(network, clock));
  }

  auto adapters = tollbooth::chain::adapter_set{};
  if (!evm.empty()) {
    auto key = decode_key(family_key(networks, chain_family::evm),
                          chain_family::evm);
    auto signer = tollbooth::crypto::secp256k1_signer::from_private_key(key);
    if (!signer) {
      tollbooth::common::critical("evm signer_key is not a valid secp256k1 key");
    }
    auto adapter = std::make_shared<tollbooth::chain::evm_adapter>(
        std::move(*signer), std::move(evm));
    spdlog::info("evm settlement account {}",
                 format_address(chain_family::evm, adapter->address()));
    adapters.add(std::move(adapter));
  }
  if (!ed25519.empty()) {
    auto key = decode_key(family_key(networks, chain_family::ed25519),
                          chain_family::ed25519);
    auto signer = tollbooth::crypto::ed25519_signer::from_seed(key);
    if (!signer) {
      tollbooth::common::critical("ed25519 signer_key is not a valid seed");
    }
    spdlog::info("ed25519 settlement key {}",
                 to_base58(signer->public_key()));
    adapters.add(std::make_shared<tollbooth::chain::ed25519_adapter>(
        std::move(*signer), std::move(ed25519)));
  }
  return adapters;
}

facilitator_options make_facilitator_options(
    const tollbooth::config::settlement_config& settlement) {
  auto options = facilitator_options{};
  options.settlement.retry = tollbooth::settlement::retry_policy{
      .initial_delay = settlement.initial_delay_ms,
      .multiplier = settlement.backoff_multiplier,
      .max_retries = settlement.max_retries};
  options.settlement.reservation_grace =
      settlement.reservation_grace_seconds * 1000;
  options.settlement.timeout_retention =
      settlement.timeout_retention_seconds * 1000;
  options.poll_interval = std::chrono::milliseconds{settlement.poll_interval_ms};
  options.sweep_interval =
      std::chrono::milliseconds{settlement.sweep_interval_ms};
  return options;
}

}  // namespace tollbooth::service
