#include <tollbooth/crypto/verify.hpp>
#include <tollbooth/registry/requirement_registry.hpp>
#include <tollbooth/verification/ed25519_message.hpp>
#include <tollbooth/verification/eip712.hpp>
#include <tollbooth/verification/signature_verifier.hpp>

#include <string>

using namespace tollbooth::schema;

namespace tollbooth::verification {

namespace {

failure fail(const error_code code, std::string reason) {
  return failure{.code = code, .reason = std::move(reason)};
}

std::optional<failure> check_amount(const payment_authorization_t& authorization,
                                    const payment_requirement_t& requirement,
                                    const pricing_oracle* oracle) {
  const auto& amount = authorization.amount;
  const auto& maximum = requirement.max_amount_required;
  switch (requirement.scheme) {
    case payment_scheme::exact:
      if (amount != maximum) {
        return fail(error_code::insufficient_amount,
                    "exact scheme requires " + to_decimal(maximum) +
                        ", authorized " + to_decimal(amount));
      }
      return std::nullopt;
    case payment_scheme::upto:
      if (amount == 0 || amount > maximum) {
        return fail(error_code::insufficient_amount,
                    "upto scheme allows 1.." + to_decimal(maximum) +
                        ", authorized " + to_decimal(amount));
      }
      return std::nullopt;
    case payment_scheme::dynamic: {
      auto quote = oracle != nullptr ? oracle->quote(requirement)
                                     : std::optional<amount_t>{};
      if (!quote) {
        return fail(error_code::invalid_requirement,
                    "no price quote for dynamic requirement");
      }
      if (amount != *quote || amount > maximum) {
        return fail(error_code::insufficient_amount,
                    "dynamic quote is " + to_decimal(*quote) + ", authorized " +
                        to_decimal(amount));
      }
      return std::nullopt;
    }
  }
  return fail(error_code::invalid_requirement, "unknown scheme");
}

failure signature_mismatch(const payment_authorization_t& authorization,
                           const chain_family family) {
  return fail(error_code::signature_invalid,
              "signature does not recover to payer " +
                  format_address(family, authorization.payer));
}

std::optional<failure> check_evm_signature(
    const payment_authorization_t& authorization,
    const payment_requirement_t& requirement) {
  if (authorization.signature.size() != 65) {
    return signature_mismatch(authorization, chain_family::evm);
  }
  auto digest = eip712::digest(authorization, requirement);
  if (!digest) {
    return fail(error_code::internal_error,
                "Keccak-256 is unavailable; cannot compute the EIP-712 digest");
  }
  auto signer =
      tollbooth::crypto::recover_evm_address(*digest, authorization.signature);
  if (!signer || *signer != authorization.payer) {
    return signature_mismatch(authorization, chain_family::evm);
  }
  return std::nullopt;
}

std::optional<failure> check_ed25519_signature(
    const payment_authorization_t& authorization,
    const payment_requirement_t& requirement) {
  auto message = make_ed25519_message(authorization, requirement);
  if (!tollbooth::crypto::verify_ed25519(message, authorization.payer,
                                         authorization.signature)) {
    return signature_mismatch(authorization, chain_family::ed25519);
  }
  return std::nullopt;
}

}  // namespace

signature_verifier::signature_verifier(
    std::shared_ptr<const pricing_oracle> oracle)
    : oracle_{std::move(oracle)} {}

verification_result_t signature_verifier::verify(
    const payment_authorization_t& authorization,
    const payment_requirement_t& requirement,
    const timestamp_seconds_t now) const {
  const auto family = requirement.network.family;

  if (auto error = tollbooth::registry::validate(requirement)) {
    return *error;
  }
  if (!is_well_formed_address(family, authorization.payer)) {
    return fail(error_code::malformed_authorization,
                "payer is not a valid " + std::string{to_string(family)} +
                    " address");
  }

  // 1. Binding.
  if (authorization.scheme != requirement.scheme) {
    return fail(error_code::invalid_requirement,
                "authorization scheme " +
                    std::string{to_string(authorization.scheme)} +
                    " does not match requirement scheme " +
                    std::string{to_string(requirement.scheme)});
  }
  if (authorization.network != requirement.network) {
    return fail(error_code::recipient_mismatch,
                "authorization network " + authorization.network.name +
                    " does not match " + requirement.network.name);
  }
  if (authorization.payee != requirement.pay_to) {
    return fail(error_code::recipient_mismatch,
                "payee " + format_address(family, authorization.payee) +
                    " does not match payTo " +
                    format_address(family, requirement.pay_to));
  }

  // 2. Amount.
  if (auto error = check_amount(authorization, requirement, oracle_.get())) {
    return *error;
  }

  // 3. Time window, inclusive on both ends.
  if (now < authorization.valid_after) {
    return fail(error_code::authorization_not_yet_valid,
                "valid after " + std::to_string(authorization.valid_after));
  }
  if (now > authorization.valid_before) {
    return fail(error_code::authorization_expired,
                "valid before " + std::to_string(authorization.valid_before));
  }

  // 4. Signature.
  auto error = family == chain_family::evm
                   ? check_evm_signature(authorization, requirement)
                   : check_ed25519_signature(authorization, requirement);
  if (error) {
    return *error;
  }

  return verified_payer{.payer = authorization.payer,
                        .network = authorization.network};
}

}  // namespace tollbooth::verification
