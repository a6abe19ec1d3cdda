#pragma once
#include <tollbooth/schema/error_code.hpp>
#include <tollbooth/schema/payment_authorization.hpp>
#include <tollbooth/schema/payment_requirement.hpp>
#include <tollbooth/verification/pricing_oracle.hpp>

#include <memory>
#include <variant>

namespace tollbooth::verification {

struct verified_payer final {
  tollbooth::schema::address_t payer;
  tollbooth::schema::network_t network;
};

using verification_result_t =
    std::variant<verified_payer, tollbooth::schema::failure>;

/// Checks an authorization against a requirement in a fixed order: requirement
/// shape, binding (scheme, network, payee), amount, time window, signature.
/// Pure: it touches neither the chain nor the nonce store.
class signature_verifier final {
 public:
  explicit signature_verifier(
      std::shared_ptr<const pricing_oracle> oracle = nullptr);

  verification_result_t verify(
      const tollbooth::schema::payment_authorization_t& authorization,
      const tollbooth::schema::payment_requirement_t& requirement,
      tollbooth::schema::timestamp_seconds_t now) const;

 private:
  std::shared_ptr<const pricing_oracle> oracle_;
};

}  // namespace tollbooth::verification
