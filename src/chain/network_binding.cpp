#include <tollbooth/chain/network_binding.hpp>

namespace tollbooth::chain {

const network_binding* find_binding(const std::vector<network_binding>& bindings,
                                    const tollbooth::schema::network_t& network) {
  for (const auto& binding : bindings) {
    if (binding.network == network) {
      return &binding;
    }
  }
  return nullptr;
}

}  // namespace tollbooth::chain
