#pragma once
#include <tollbooth/chain/adapter.hpp>
#include <tollbooth/chain/circuit_breaker.hpp>
#include <tollbooth/config/config.hpp>
#include <tollbooth/service/facilitator.hpp>

#include <string>
#include <vector>

namespace tollbooth::service {

/// Configured networks this build cannot settle: EVM networks when the linked
/// OpenSSL has no Keccak-256.
std::vector<std::string> unusable_networks(
    const std::vector<tollbooth::config::network_config>& networks);

/// Endpoint pools, signers and adapters for the configured networks. An
/// unusable signer key or network is fatal.
tollbooth::chain::adapter_set make_adapters(
    const std::vector<tollbooth::config::network_config>& networks,
    tollbooth::chain::circuit_breaker::clock_fn clock);

facilitator_options make_facilitator_options(
    const tollbooth::config::settlement_config& settlement);

}  // namespace tollbooth::service
