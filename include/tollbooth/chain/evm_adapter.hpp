#pragma once
#include <tollbooth/chain/adapter.hpp>
#include <tollbooth/chain/network_binding.hpp>
#include <tollbooth/crypto/signer.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tollbooth::chain {

inline constexpr auto kSettlementGasLimit = uint64_t{100'000};
inline constexpr auto kTransferWithAuthorizationSignature = std::string_view{
    "transferWithAuthorization(address,address,uint256,uint256,uint256,"
    "bytes32,uint8,bytes32,bytes32)"};

/// Hands out the facilitator account's transaction nonces per network. Each
/// allocation reads the node's pending count and takes the larger of it and
/// the next locally allocated value, so concurrent prepares never sign with
/// the same nonce.
class account_nonce_allocator final {
 public:
  using fetch_fn = std::function<tollbooth::schema::amount_t()>;

  tollbooth::schema::amount_t allocate(const std::string& network,
                                       const fetch_fn& pending);

  /// Drops the local count; the next allocation trusts the node again. Used
  /// when an allocated nonce will never be broadcast.
  void forget(const std::string& network);

 private:
  struct slot final {
    std::mutex mutex;
    std::optional<tollbooth::schema::amount_t> next;
  };

  slot& slot_for(const std::string& network);

  std::mutex slots_mutex_;
  std::map<std::string, std::unique_ptr<slot>> slots_;
};

/// Settles EIP-3009 authorizations by sending transferWithAuthorization to the
/// token contract in an EIP-155 legacy transaction signed with the
/// facilitator's key. The reference is the transaction hash.
class evm_adapter final : public chain_adapter {
 public:
  evm_adapter(tollbooth::crypto::secp256k1_signer signer,
              std::vector<network_binding> bindings);

  tollbooth::schema::chain_family family() const override {
    return tollbooth::schema::chain_family::evm;
  }
  std::vector<tollbooth::schema::network_t> networks() const override;
  bool supports(const tollbooth::schema::network_t& network) const override;
  uint64_t required_confirmations(
      const tollbooth::schema::network_t& network) const override;

  fee_estimate estimate_fee(
      const tollbooth::schema::payment_requirement_t& requirement) override;

  prepared_transaction prepare(
      const tollbooth::schema::payment_authorization_t& authorization,
      const tollbooth::schema::payment_requirement_t& requirement) override;

  tollbooth::schema::transaction_ref_t submit(
      const tollbooth::schema::network_t& network,
      const prepared_transaction& transaction) override;

  transaction_status_t status(
      const tollbooth::schema::network_t& network,
      const tollbooth::schema::transaction_ref_t& reference) override;

  /// The facilitator's own account, which pays for gas.
  const tollbooth::schema::address_t& address() const { return address_; }

 private:
  const network_binding& binding(
      const tollbooth::schema::network_t& network) const;
  tollbooth::schema::amount_t gas_price(const network_binding& binding);
  uint64_t gas_limit(const network_binding& binding) const;

  tollbooth::crypto::secp256k1_signer signer_;
  tollbooth::schema::address_t address_;
  std::vector<network_binding> bindings_;
  account_nonce_allocator nonces_;
};

/// ABI call data for transferWithAuthorization, v normalized to 27/28.
std::optional<tollbooth::schema::bytes_t> make_transfer_call_data(
    const tollbooth::schema::payment_authorization_t& authorization);

}  // namespace tollbooth::chain
