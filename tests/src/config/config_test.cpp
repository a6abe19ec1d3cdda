#include <gtest/gtest.h>
#include <tollbooth/config/config.hpp>

#include <sstream>

using namespace tollbooth::config;
using tollbooth::schema::chain_family;

namespace {

daemon_config load_string(const std::string& text) {
  auto input = std::istringstream{text};
  auto config = daemon_config{};
  load(input, config);
  return config;
}

}  // namespace

TEST(config, defaults_without_sections) {
  auto config = load_string("");
  EXPECT_EQ(config.settlement.max_retries, 3u);
  EXPECT_EQ(config.settlement.initial_delay_ms, 500u);
  EXPECT_DOUBLE_EQ(config.settlement.backoff_multiplier, 2.0);
  EXPECT_EQ(config.settlement.reservation_grace_seconds, 120u);
  EXPECT_EQ(config.settlement.timeout_retention_seconds, 86'400u);
  EXPECT_EQ(config.settlement.workers, 8u);
  EXPECT_TRUE(config.networks.empty());
  EXPECT_EQ(config.listen, "0.0.0.0:50402");
}

TEST(config, reads_settlement_and_networks) {
  auto config = load_string(R"(
[settlement]
max_retries = 5
initial_delay_ms = 250
backoff_multiplier = 1.5
poll_interval_ms = 1000
timeout_retention_seconds = 600
workers = 2

[network.base-sepolia]
rpc = https://sepolia.base.org
rpc = https://base-sepolia.publicnode.com
signer_key = 0x0000000000000000000000000000000000000000000000000000000000000001
gas_multiplier = 1.5

[network.solana-devnet]
rpc = https://api.devnet.solana.com
confirmations = 2
breaker_failures = 3
rpc_timeout_ms = 2500
)");

  EXPECT_EQ(config.settlement.max_retries, 5u);
  EXPECT_EQ(config.settlement.initial_delay_ms, 250u);
  EXPECT_DOUBLE_EQ(config.settlement.backoff_multiplier, 1.5);
  EXPECT_EQ(config.settlement.poll_interval_ms, 1000u);
  EXPECT_EQ(config.settlement.sweep_interval_ms, 5000u);
  EXPECT_EQ(config.settlement.timeout_retention_seconds, 600u);
  EXPECT_EQ(config.settlement.workers, 2u);

  ASSERT_EQ(config.networks.size(), 2u);
  const auto& base = config.networks[0];
  EXPECT_EQ(base.network.name, "base-sepolia");
  EXPECT_EQ(base.network.family, chain_family::evm);
  EXPECT_EQ(base.network.chain_id, 84532u);
  ASSERT_EQ(base.rpc.size(), 2u);
  EXPECT_EQ(base.rpc[1], "https://base-sepolia.publicnode.com");
  EXPECT_DOUBLE_EQ(base.gas_multiplier, 1.5);
  EXPECT_EQ(base.confirmations, 1u);
  EXPECT_FALSE(base.signer_key.empty());

  const auto& devnet = config.networks[1];
  EXPECT_EQ(devnet.network.family, chain_family::ed25519);
  EXPECT_EQ(devnet.confirmations, 2u);
  EXPECT_EQ(devnet.breaker_failures, 3u);
  EXPECT_EQ(devnet.breaker_cooldown_ms, 30'000u);
  EXPECT_EQ(devnet.rpc_timeout_ms, 2500u);
}

TEST(config, custom_network_needs_family_and_chain_id) {
  EXPECT_THROW(load_string("[network.devchain]\nrpc = http://localhost:8545\n"),
               config_error);
  EXPECT_THROW(load_string("[network.devchain]\nrpc = http://localhost:8545\n"
                           "family = evm\n"),
               config_error);

  auto config = load_string(
      "[network.devchain]\nrpc = http://localhost:8545\nfamily = evm\n"
      "chain_id = 31337\n");
  ASSERT_EQ(config.networks.size(), 1u);
  EXPECT_EQ(config.networks[0].network.chain_id, 31337u);
  EXPECT_EQ(config.networks[0].network.family, chain_family::evm);
}

TEST(config, rejects_bad_input) {
  // No endpoint.
  EXPECT_THROW(load_string("[network.base]\nconfirmations = 2\n"), config_error);
  // Unknown keys.
  EXPECT_THROW(load_string("[network.base]\nrpc = http://a\ncolour = red\n"),
               config_error);
  EXPECT_THROW(load_string("[metrics]\nport = 9100\n"), config_error);
  // Bad values.
  EXPECT_THROW(load_string("[network.base]\nrpc = http://a\nconfirmations = 0\n"),
               config_error);
  EXPECT_THROW(load_string("[network.base]\nrpc = http://a\nconfirmations = x\n"),
               config_error);
  EXPECT_THROW(load_string("[network.base]\nrpc = http://a\ngas_multiplier = 0.5\n"),
               config_error);
  EXPECT_THROW(
      load_string("[network.x]\nrpc = http://a\nfamily = cosmos\nchain_id = 1\n"),
      config_error);
  EXPECT_THROW(load_string("[settlement]\nbackoff_multiplier = 0.5\n"),
               config_error);
  EXPECT_THROW(load_string("[settlement]\nmax_retries = many\n"), config_error);
}

TEST(config, missing_file) {
  auto config = daemon_config{};
  EXPECT_THROW(load_file("/nonexistent/tollbooth.ini", config), config_error);
}
