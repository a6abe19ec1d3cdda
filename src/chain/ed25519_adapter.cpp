#include <tollbooth/chain/ed25519_adapter.hpp>
#include <tollbooth/chain/errors.hpp>
#include <tollbooth/chain/json.hpp>
#include <tollbooth/schema/key/builder.hpp>
#include <tollbooth/verification/ed25519_message.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

using namespace tollbooth::schema;

namespace tollbooth::chain {

namespace {

bool is_already_processed(const json_rpc_error& error) {
  const auto& message = error.rpc_message();
  return message.find("already processed") != std::string::npos ||
         message.find("AlreadyProcessed") != std::string::npos;
}

}  // namespace

bytes_t encode_envelope(const ed25519_envelope& envelope) {
  auto b = key::builder{};
  b.write_prefixed(envelope.message);
  b.write(envelope.payer_signature);
  b.write(envelope.facilitator_public_key);
  b.write(envelope.facilitator_signature);
  return b.data;
}

std::optional<ed25519_envelope> decode_envelope(const bytes_view_t& bytes) {
  if (bytes.size() < 4) {
    return std::nullopt;
  }
  auto length = std::size_t{0};
  for (auto i = std::size_t{0}; i < 4; ++i) {
    length |= static_cast<std::size_t>(bytes[i]) << (i * 8);
  }
  if (bytes.size() != 4 + length + 64 + 32 + 64) {
    return std::nullopt;
  }
  auto rest = bytes.subspan(4);
  auto envelope = ed25519_envelope{};
  envelope.message = make_bytes(rest.subspan(0, length));
  envelope.payer_signature = make_bytes(rest.subspan(length, 64));
  envelope.facilitator_public_key = make_bytes(rest.subspan(length + 64, 32));
  envelope.facilitator_signature = make_bytes(rest.subspan(length + 96, 64));
  return envelope;
}

ed25519_adapter::ed25519_adapter(tollbooth::crypto::ed25519_signer signer,
                                 std::vector<network_binding> bindings)
    : signer_{std::move(signer)}, bindings_{std::move(bindings)} {}

std::vector<network_t> ed25519_adapter::networks() const {
  auto out = std::vector<network_t>{};
  for (const auto& entry : bindings_) {
    out.push_back(entry.network);
  }
  return out;
}

bool ed25519_adapter::supports(const network_t& network) const {
  return find_binding(bindings_, network) != nullptr;
}

uint64_t ed25519_adapter::required_confirmations(
    const network_t& network) const {
  return binding(network).required_confirmations;
}

const network_binding& ed25519_adapter::binding(
    const network_t& network) const {
  const auto* found = find_binding(bindings_, network);
  if (found == nullptr) {
    throw chain_rejected{"network " + network.name + " is not configured"};
  }
  return *found;
}

fee_estimate ed25519_adapter::estimate_fee(
    const payment_requirement_t& requirement) {
  static_cast<void>(binding(requirement.network));
  // Payer and facilitator signatures.
  return fee_estimate{.amount = amount_t{kLamportsPerSignature * 2},
                      .unit = "lamports"};
}

prepared_transaction ed25519_adapter::prepare(
    const payment_authorization_t& authorization,
    const payment_requirement_t& requirement) {
  static_cast<void>(binding(requirement.network));
  if (authorization.signature.size() != 64) {
    throw chain_rejected{"payer signature must be 64 bytes"};
  }

  auto envelope = ed25519_envelope{
      .message = tollbooth::verification::make_ed25519_message(authorization,
                                                                requirement),
      .payer_signature = authorization.signature,
      .facilitator_public_key = signer_.public_key(),
      .facilitator_signature = {}};

  auto signed_part = key::builder{};
  signed_part.write_prefixed(envelope.message);
  signed_part.write(envelope.payer_signature);
  auto signature = signer_.sign(signed_part.data);
  if (!signature) {
    throw chain_rejected{"failed to co-sign settlement envelope"};
  }
  envelope.facilitator_signature = std::move(*signature);

  auto reference = to_base58(envelope.facilitator_signature);
  return prepared_transaction{.reference = std::move(reference),
                              .raw = encode_envelope(envelope)};
}

transaction_ref_t ed25519_adapter::submit(
    const network_t& network,
    const prepared_transaction& transaction) {
  const auto& target = binding(network);
  try {
    target.pool->call(
        "sendTransaction",
        json::params({json::string(to_base64(transaction.raw)),
                      json::object({{"encoding", json::string("base64")}})}));
  } catch (const json_rpc_error& e) {
    if (!is_already_processed(e)) {
      throw;
    }
    spdlog::info("[{}] {} already processed", network.name,
                 transaction.reference);
  }
  return transaction.reference;
}

transaction_status_t ed25519_adapter::status(
    const network_t& network,
    const transaction_ref_t& reference) {
  const auto& target = binding(network);
  auto result = target.pool->call(
      "getSignatureStatuses",
      json::params({json::list({json::string(reference)}),
                    json::object({{"searchTransactionHistory",
                                   json::boolean(true)}})}));

  const auto* value = json::field(result, "value");
  if (value == nullptr || !value->has_list_value() ||
      value->list_value().values_size() == 0) {
    throw chain_unavailable{"malformed getSignatureStatuses response"};
  }
  const auto& entry = value->list_value().values(0);
  if (json::is_null(entry)) {
    return tx_not_found{};
  }

  const auto* error = json::field(entry, "err");
  if (error != nullptr && !json::is_null(*error)) {
    return tx_failed{.reason = json::to_string(*error)};
  }
  auto confirmation_status = json::string_field(entry, "confirmationStatus");
  if (confirmation_status == "finalized") {
    return tx_confirmed{.confirmations = target.required_confirmations};
  }
  auto confirmations = json::number_field(entry, "confirmations").value_or(0);
  if (confirmations < 1) {
    return tx_pending{};
  }
  return tx_confirmed{.confirmations = static_cast<uint64_t>(confirmations)};
}

}  // namespace tollbooth::chain
