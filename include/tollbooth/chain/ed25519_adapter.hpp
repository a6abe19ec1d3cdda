#pragma once
#include <tollbooth/chain/adapter.hpp>
#include <tollbooth/chain/network_binding.hpp>
#include <tollbooth/crypto/signer.hpp>

#include <vector>

namespace tollbooth::chain {

inline constexpr auto kLamportsPerSignature = uint64_t{5'000};

/// Settlement envelope for Ed25519 networks:
///   len32(message) message || payer signature (64)
///   || facilitator public key (32) || facilitator signature (64)
/// The facilitator signs everything before its public key. Its signature,
/// base58 encoded, is the transaction reference.
struct ed25519_envelope final {
  tollbooth::schema::bytes_t message;
  tollbooth::schema::bytes_t payer_signature;
  tollbooth::schema::bytes_t facilitator_public_key;
  tollbooth::schema::bytes_t facilitator_signature;
};

tollbooth::schema::bytes_t encode_envelope(const ed25519_envelope& envelope);
std::optional<ed25519_envelope> decode_envelope(
    const tollbooth::schema::bytes_view_t& bytes);

class ed25519_adapter final : public chain_adapter {
 public:
  ed25519_adapter(tollbooth::crypto::ed25519_signer signer,
                  std::vector<network_binding> bindings);

  tollbooth::schema::chain_family family() const override {
    return tollbooth::schema::chain_family::ed25519;
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

 private:
  const network_binding& binding(
      const tollbooth::schema::network_t& network) const;

  tollbooth::crypto::ed25519_signer signer_;
  std::vector<network_binding> bindings_;
};

}  // namespace tollbooth::chain
