#include <tollbooth/schema/encoding/scale/payment_record.hpp>

namespace tollbooth::schema::encoding::scale {

namespace {

constexpr auto kPaymentRecordVersion = uint16_t{1};

}  // namespace

network_wire_t to_wire(const network_t& value) {
  return {value.name, static_cast<uint8_t>(value.family), value.chain_id};
}

network_t from_wire(network_wire_t&& value) {
  auto& [name, family, chain_id] = value;
  return network_t{.name = std::move(name),
                   .family = static_cast<chain_family>(family),
                   .chain_id = chain_id};
}

payment_requirement_wire_t to_wire(const payment_requirement_t& value) {
  return {static_cast<uint8_t>(value.scheme),
          to_wire(value.network),
          value.asset,
          to_be_bytes32(value.max_amount_required),
          value.pay_to,
          value.max_timeout_seconds,
          value.resource,
          value.description,
          value.mime_type,
          value.eip712_name,
          value.eip712_version};
}

payment_requirement_t from_wire(payment_requirement_wire_t&& value) {
  auto& [scheme, network, asset, max_amount, pay_to, timeout, resource,
         description, mime_type, eip712_name, eip712_version] = value;
  return payment_requirement_t{
      .scheme = static_cast<payment_scheme>(scheme),
      .network = from_wire(std::move(network)),
      .asset = std::move(asset),
      .max_amount_required = from_be_bytes(max_amount),
      .pay_to = std::move(pay_to),
      .max_timeout_seconds = timeout,
      .resource = std::move(resource),
      .description = std::move(description),
      .mime_type = std::move(mime_type),
      .eip712_name = std::move(eip712_name),
      .eip712_version = std::move(eip712_version)};
}

payment_authorization_wire_t to_wire(const payment_authorization_t& value) {
  return {static_cast<uint8_t>(value.scheme),
          to_wire(value.network),
          value.payer,
          value.payee,
          to_be_bytes32(value.amount),
          value.valid_after,
          value.valid_before,
          value.nonce,
          value.signature};
}

payment_authorization_t from_wire(payment_authorization_wire_t&& value) {
  auto& [scheme, network, payer, payee, amount, valid_after, valid_before,
         nonce, signature] = value;
  return payment_authorization_t{.scheme = static_cast<payment_scheme>(scheme),
                                 .network = from_wire(std::move(network)),
                                 .payer = std::move(payer),
                                 .payee = std::move(payee),
                                 .amount = from_be_bytes(amount),
                                 .valid_after = valid_after,
                                 .valid_before = valid_before,
                                 .nonce = nonce,
                                 .signature = std::move(signature)};
}

payment_record_wire_t to_wire(const payment_record_t& value) {
  return {kPaymentRecordVersion,
          value.id,
          static_cast<uint8_t>(value.status),
          to_wire(value.requirement),
          to_wire(value.authorization),
          value.transaction_ref,
          value.prepared,
          value.confirmations,
          static_cast<uint16_t>(value.failure_code),
          value.failure_reason,
          value.attempts,
          value.created_at,
          value.updated_at,
          value.deadline,
          to_be_bytes32(value.fee)};
}

payment_record_t from_wire(payment_record_wire_t&& value) {
  auto& [version, id, status, requirement, authorization, transaction_ref,
         prepared, confirmations, failure_code, failure_reason, attempts,
         created_at, updated_at, deadline, fee] = value;
  static_cast<void>(version);
  return payment_record_t{
      .id = id,
      .status = static_cast<payment_status>(status),
      .requirement = from_wire(std::move(requirement)),
      .authorization = from_wire(std::move(authorization)),
      .transaction_ref = std::move(transaction_ref),
      .prepared = std::move(prepared),
      .confirmations = confirmations,
      .failure_code = static_cast<error_code>(failure_code),
      .failure_reason = std::move(failure_reason),
      .attempts = attempts,
      .created_at = created_at,
      .updated_at = updated_at,
      .deadline = deadline,
      .fee = from_be_bytes(fee)};
}

}  // namespace tollbooth::schema::encoding::scale
