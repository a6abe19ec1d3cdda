#include <tollbooth/config/config.hpp>

#include <boost/lexical_cast.hpp>

#include <fstream>
#include <map>

using namespace tollbooth::schema;
namespace po = boost::program_options;

namespace tollbooth::config {

namespace {

inline constexpr auto kNetworkSection = std::string_view{"network."};

template <typename T>
T parse_value(const std::string& key, const std::string& value) {
  try {
    return boost::lexical_cast<T>(value);
  } catch (const boost::bad_lexical_cast&) {
    throw config_error{"invalid value '" + value + "' for " + key};
  }
}

struct raw_network final {
  std::vector<std::string> rpc;
  std::map<std::string, std::string> values;
};

network_config make_network_config(const std::string& name,
                                   const raw_network& raw) {
  auto out = network_config{};
  auto known = find_known_network(name);
  if (known) {
    out.network = network_t{.name = name,
                            .family = known->family,
                            .chain_id = known->chain_id};
    out.confirmations = known->confirmations;
  } else {
    out.network.name = name;
  }

  for (const auto& [field, value] : raw.values) {
    auto key = "network." + name + "." + field;
    if (field == "family") {
      auto family = try_from_string<chain_family>(value);
      if (!family) {
        throw config_error{"unknown family '" + value + "' for " + key};
      }
      out.network.family = *family;
    } else if (field == "chain_id") {
      out.network.chain_id = parse_value<uint64_t>(key, value);
    } else if (field == "confirmations") {
      out.confirmations = parse_value<uint64_t>(key, value);
    } else if (field == "signer_key") {
      out.signer_key = value;
    } else if (field == "gas_multiplier") {
      out.gas_multiplier = parse_value<double>(key, value);
    } else if (field == "breaker_failures") {
      out.breaker_failures = parse_value<uint32_t>(key, value);
    } else if (field == "breaker_cooldown_ms") {
      out.breaker_cooldown_ms = parse_value<uint64_t>(key, value);
    } else if (field == "rpc_timeout_ms") {
      out.rpc_timeout_ms = parse_value<uint64_t>(key, value);
    } else {
      throw config_error{"unknown option " + key};
    }
  }

  if (!known && (!raw.values.contains("family") ||
                 !raw.values.contains("chain_id"))) {
    throw config_error{"network '" + name +
                       "' is not built in and needs family and chain_id"};
  }
  if (raw.rpc.empty()) {
    throw config_error{"network '" + name + "' has no rpc endpoint"};
  }
  if (out.confirmations == 0) {
    throw config_error{"network '" + name + "' needs at least 1 confirmation"};
  }
  if (out.gas_multiplier < 1.0) {
    throw config_error{"gas_multiplier for '" + name + "' must be >= 1.0"};
  }
  out.rpc = raw.rpc;
  return out;
}

}  // namespace

po::options_description command_line_options(daemon_config& config) {
  auto description = po::options_description{"tollbooth"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config.config_path),
      "Path to the INI configuration file")(
      "listen,l",
      po::value<std::string>(&config.listen)->default_value(config.listen),
      "IP:Port for the gRPC server")(
      "db-path,d",
      po::value<std::string>(&config.db_path)->default_value(config.db_path),
      "RocksDB directory")(
      "log-level",
      po::value<std::string>(&config.log_level)->default_value(config.log_level),
      "trace, debug, info, warn, error or critical")(
      "log-file",
      po::value<std::string>(&config.log_file)->default_value(config.log_file),
      "Log file, appended to");
  return description;
}

void load(std::istream& input, daemon_config& config) {
  auto& settlement = config.settlement;
  auto description = po::options_description{"settlement"};
  description.add_options()(
      "settlement.max_retries",
      po::value<uint32_t>(&settlement.max_retries)
          ->default_value(settlement.max_retries))(
      "settlement.initial_delay_ms",
      po::value<uint64_t>(&settlement.initial_delay_ms)
          ->default_value(settlement.initial_delay_ms))(
      "settlement.backoff_multiplier",
      po::value<double>(&settlement.backoff_multiplier)
          ->default_value(settlement.backoff_multiplier))(
      "settlement.poll_interval_ms",
      po::value<uint64_t>(&settlement.poll_interval_ms)
          ->default_value(settlement.poll_interval_ms))(
      "settlement.sweep_interval_ms",
      po::value<uint64_t>(&settlement.sweep_interval_ms)
          ->default_value(settlement.sweep_interval_ms))(
      "settlement.reservation_grace_seconds",
      po::value<uint64_t>(&settlement.reservation_grace_seconds)
          ->default_value(settlement.reservation_grace_seconds))(
      "settlement.timeout_retention_seconds",
      po::value<uint64_t>(&settlement.timeout_retention_seconds)
          ->default_value(settlement.timeout_retention_seconds))(
      "settlement.workers",
      po::value<uint32_t>(&settlement.workers)
          ->default_value(settlement.workers));

  auto vm = po::variables_map{};
  auto raw = std::map<std::string, raw_network>{};
  try {
    auto parsed = po::parse_config_file(input, description, true);
    po::store(parsed, vm);
    po::notify(vm);

    for (const auto& option : parsed.options) {
      if (!option.unregistered) {
        continue;
      }
      auto key = std::string_view{option.string_key};
      if (!key.starts_with(kNetworkSection)) {
        throw config_error{"unknown option " + option.string_key};
      }
      key.remove_prefix(kNetworkSection.size());
      auto dot = key.rfind('.');
      if (dot == std::string_view::npos || dot == 0) {
        throw config_error{"malformed option " + option.string_key};
      }
      auto name = std::string{key.substr(0, dot)};
      auto field = std::string{key.substr(dot + 1)};
      auto& network = raw[name];
      for (const auto& value : option.value) {
        if (field == "rpc") {
          network.rpc.push_back(value);
        } else {
          network.values[field] = value;
        }
      }
    }
  } catch (const po::error& e) {
    throw config_error{e.what()};
  }

  if (settlement.backoff_multiplier < 1.0) {
    throw config_error{"settlement.backoff_multiplier must be >= 1.0"};
  }
  config.networks.clear();
  for (const auto& [name, network] : raw) {
    config.networks.push_back(make_network_config(name, network));
  }
}

void load_file(const std::string& path, daemon_config& config) {
  auto input = std::ifstream{path};
  if (!input.good()) {
    throw config_error{"cannot open config file '" + path + "'"};
  }
  load(input, config);
}

}  // namespace tollbooth::config
