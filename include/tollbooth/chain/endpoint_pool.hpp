#pragma once
#include <tollbooth/chain/circuit_breaker.hpp>
#include <tollbooth/chain/endpoint.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace tollbooth::chain {

/// The RPC endpoints of one network behind one circuit breaker. Calls start at
/// a rotating endpoint and fail over to the next on transient errors. With the
/// breaker open every call fails fast with chain_unavailable.
class endpoint_pool final {
 public:
  endpoint_pool(std::string network,
                std::vector<std::shared_ptr<endpoint>> endpoints,
                breaker_options options,
                circuit_breaker::clock_fn clock);

  google::protobuf::Value call(std::string_view method,
                               const google::protobuf::ListValue& params);

  const std::string& network() const { return network_; }
  breaker_state state() const { return breaker_.state(); }

 private:
  std::string network_;
  std::vector<std::shared_ptr<endpoint>> endpoints_;
  circuit_breaker breaker_;
  std::atomic<std::size_t> cursor_{0};
};

}  // namespace tollbooth::chain
