#pragma once
#include <tollbooth/schema/network.hpp>
#include <tollbooth/schema/primitives.hpp>

#include <boost/program_options.hpp>

#include <chrono>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace tollbooth::config {

class config_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// One [network.<name>] section.
struct network_config final {
  tollbooth::schema::network_t network;
  std::vector<std::string> rpc;
  uint64_t confirmations{1};
  // Hex: 32-byte secp256k1 private key or 32-byte Ed25519 seed.
  std::string signer_key;
  double gas_multiplier{1.2};
  uint32_t breaker_failures{5};
  tollbooth::schema::duration_milliseconds_t breaker_cooldown_ms{30'000};
  tollbooth::schema::duration_milliseconds_t rpc_timeout_ms{10'000};
};

/// The [settlement] section.
struct settlement_config final {
  uint32_t max_retries{3};
  tollbooth::schema::duration_milliseconds_t initial_delay_ms{500};
  double backoff_multiplier{2.0};
  tollbooth::schema::duration_milliseconds_t poll_interval_ms{2'000};
  tollbooth::schema::duration_milliseconds_t sweep_interval_ms{5'000};
  uint64_t reservation_grace_seconds{120};
  uint64_t timeout_retention_seconds{86'400};
  // Threads running Settle calls.
  uint32_t workers{8};
};

struct daemon_config final {
  std::string config_path;
  std::string listen{"0.0.0.0:50402"};
  std::string db_path{"tollbooth.db"};
  std::string log_level{"info"};
  std::string log_file{"tollbooth.log"};
  settlement_config settlement;
  std::vector<network_config> networks;
};

/// Command line options bound to `config`.
boost::program_options::options_description command_line_options(
    daemon_config& config);

/// Reads [settlement] and every [network.<name>] section into `config`.
/// Throws config_error.
void load(std::istream& input, daemon_config& config);
void load_file(const std::string& path, daemon_config& config);

}  // namespace tollbooth::config
