#pragma once
#include <tollbooth/schema/network.hpp>
#include <tollbooth/schema/payment_authorization.hpp>
#include <tollbooth/schema/payment_requirement.hpp>
#include <tollbooth/schema/primitives.hpp>

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace tollbooth::chain {

struct fee_estimate final {
  tollbooth::schema::amount_t amount{0};
  // Smallest native unit: "wei", "lamports".
  std::string unit;
};

/// Signed settlement transaction. `reference` is a pure function of `raw`, so
/// it can be persisted before the first broadcast and looked up afterwards.
struct prepared_transaction final {
  tollbooth::schema::transaction_ref_t reference;
  tollbooth::schema::bytes_t raw;
};

struct tx_pending final {};
struct tx_confirmed final {
  uint64_t confirmations{0};
};
struct tx_failed final {
  std::string reason;
};
struct tx_not_found final {};

using transaction_status_t =
    std::variant<tx_pending, tx_confirmed, tx_failed, tx_not_found>;

/// Boundary to one chain family. Every operation may throw chain_unavailable
/// (transient) or chain_rejected (permanent); nothing else escapes.
class chain_adapter {
 public:
  virtual ~chain_adapter() = default;

  virtual tollbooth::schema::chain_family family() const = 0;
  /// Networks this adapter was configured to settle.
  virtual std::vector<tollbooth::schema::network_t> networks() const = 0;
  virtual bool supports(const tollbooth::schema::network_t& network) const = 0;
  virtual uint64_t required_confirmations(
      const tollbooth::schema::network_t& network) const = 0;

  virtual fee_estimate estimate_fee(
      const tollbooth::schema::payment_requirement_t& requirement) = 0;

  virtual prepared_transaction prepare(
      const tollbooth::schema::payment_authorization_t& authorization,
      const tollbooth::schema::payment_requirement_t& requirement) = 0;

  /// Broadcasting the same bytes twice is not an error.
  virtual tollbooth::schema::transaction_ref_t submit(
      const tollbooth::schema::network_t& network,
      const prepared_transaction& transaction) = 0;

  virtual transaction_status_t status(
      const tollbooth::schema::network_t& network,
      const tollbooth::schema::transaction_ref_t& reference) = 0;
};

/// The closed set of adapters, one slot per chain family.
class adapter_set final {
 public:
  void add(std::shared_ptr<chain_adapter> adapter);

  /// The adapter for the network's family, if it settles that network.
  chain_adapter* find(const tollbooth::schema::network_t& network) const;

  /// Every network some adapter settles, EVM networks first.
  std::vector<tollbooth::schema::network_t> networks() const;

 private:
  std::shared_ptr<chain_adapter> evm_;
  std::shared_ptr<chain_adapter> ed25519_;
};

}  // namespace tollbooth::chain
