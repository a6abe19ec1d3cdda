#include <tollbooth/chain/adapter.hpp>

#include <initializer_list>
#include <iterator>

using namespace tollbooth::schema;

namespace tollbooth::chain {

void adapter_set::add(std::shared_ptr<chain_adapter> adapter) {
  switch (adapter->family()) {
    case chain_family::evm:
      evm_ = std::move(adapter);
      break;
    case chain_family::ed25519:
      ed25519_ = std::move(adapter);
      break;
  }
}

chain_adapter* adapter_set::find(const network_t& network) const {
  auto* adapter = static_cast<chain_adapter*>(nullptr);
  switch (network.family) {
    case chain_family::evm:
      adapter = evm_.get();
      break;
    case chain_family::ed25519:
      adapter = ed25519_.get();
      break;
  }
  if (adapter == nullptr || !adapter->supports(network)) {
    return nullptr;
  }
  return adapter;
}

std::vector<network_t> adapter_set::networks() const {
  auto out = std::vector<network_t>{};
  for (const auto* adapter : {evm_.get(), ed25519_.get()}) {
    if (adapter == nullptr) {
      continue;
    }
    auto networks = adapter->networks();
    out.insert(std::end(out), std::begin(networks), std::end(networks));
  }
  return out;
}

}  // namespace tollbooth::chain
