#include <tollbooth/chain/endpoint_pool.hpp>
#include <tollbooth/chain/errors.hpp>

#include <spdlog/spdlog.h>

namespace tollbooth::chain {

endpoint_pool::endpoint_pool(std::string network,
                             std::vector<std::shared_ptr<endpoint>> endpoints,
                             breaker_options options,
                             circuit_breaker::clock_fn clock)
    : network_{std::move(network)},
      endpoints_{std::move(endpoints)},
      breaker_{options, std::move(clock)} {}

google::protobuf::Value endpoint_pool::call(
    const std::string_view method,
    const google::protobuf::ListValue& params) {
  if (endpoints_.empty()) {
    throw chain_unavailable{"no rpc endpoints configured for " + network_};
  }
  if (!breaker_.allow()) {
    throw chain_unavailable{"circuit open for " + network_};
  }

  auto start = cursor_.fetch_add(1);
  auto last_error = std::string{};
  for (std::size_t i = 0; i < endpoints_.size(); ++i) {
    auto& target = endpoints_[(start + i) % endpoints_.size()];
    try {
      auto result = target->call(method, params);
      breaker_.record_success();
      return result;
    } catch (const chain_unavailable& e) {
      last_error = e.what();
      spdlog::warn("[{}] {} via {} unavailable: {}", network_, method,
                   target->url(), e.what());
    } catch (const chain_rejected&) {
      // The node answered, so the network is healthy.
      breaker_.record_success();
      throw;
    }
  }

  breaker_.record_failure();
  if (breaker_.state() == breaker_state::open) {
    spdlog::error("[{}] circuit opened: {}", network_, last_error);
  }
  throw chain_unavailable{network_ + ": " + last_error};
}

}  // namespace tollbooth::chain
