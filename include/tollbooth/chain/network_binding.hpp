#pragma once
#include <tollbooth/chain/endpoint_pool.hpp>
#include <tollbooth/schema/network.hpp>

#include <memory>
#include <optional>
#include <vector>

namespace tollbooth::chain {

/// What an adapter needs to settle on one network.
struct network_binding final {
  tollbooth::schema::network_t network;
  uint64_t required_confirmations{1};
  std::shared_ptr<endpoint_pool> pool;
  // Applied to the settlement gas limit on EVM networks.
  double fee_multiplier{1.2};
};

const network_binding* find_binding(const std::vector<network_binding>& bindings,
                                    const tollbooth::schema::network_t& network);

}  // namespace tollbooth::chain
