#include <tollbooth/codec/payment_codec.hpp>

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <charconv>
#include <limits>

using namespace tollbooth::schema;

namespace tollbooth::codec {

namespace {

failure malformed(std::string reason) {
  return failure{.code = error_code::malformed_authorization,
                 .reason = std::move(reason)};
}

failure invalid(std::string reason) {
  return failure{.code = error_code::invalid_requirement,
                 .reason = std::move(reason)};
}

std::optional<uint64_t> try_parse_seconds(const std::string_view text) {
  auto value = uint64_t{0};
  auto [end, error] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || error != std::errc{} || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<bytes_t> try_parse_signature(const chain_family family,
                                           const std::string_view text) {
  if (family == chain_family::evm ||
      (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))) {
    return try_from_hex(text);
  }
  return try_from_base58(text);
}

std::string format_signature(const chain_family family,
                             const bytes_view_t& signature) {
  if (family == chain_family::evm) {
    return to_hex_prefixed(signature);
  }
  return to_base58(signature);
}

}  // namespace

authorization_result_t to_authorization(const tollbooth::v1::PaymentPayload& payload,
                                        const network_resolver_fn& resolve) {
  if (payload.x402_version() != kX402Version) {
    return malformed("unsupported x402Version " +
                     std::to_string(payload.x402_version()));
  }
  auto scheme = try_from_string<payment_scheme>(payload.scheme());
  if (!scheme) {
    return malformed("unknown scheme '" + payload.scheme() + "'");
  }
  auto network = resolve(payload.network());
  if (!network) {
    return failure{.code = error_code::unsupported_network,
                   .reason = "unknown network '" + payload.network() + "'"};
  }
  if (!payload.has_payload() || !payload.payload().has_authorization()) {
    return malformed("missing authorization");
  }
  const auto& body = payload.payload();
  const auto& authorization = body.authorization();

  auto out = payment_authorization_t{};
  out.scheme = *scheme;
  out.network = *network;

  auto payer = try_parse_address(network->family, authorization.from());
  if (!payer) {
    return malformed("invalid from address");
  }
  out.payer = std::move(*payer);
  auto payee = try_parse_address(network->family, authorization.to());
  if (!payee) {
    return malformed("invalid to address");
  }
  out.payee = std::move(*payee);
  auto amount = try_parse_amount(authorization.value());
  if (!amount) {
    return malformed("invalid value");
  }
  out.amount = *amount;
  auto valid_after = try_parse_seconds(authorization.valid_after());
  auto valid_before = try_parse_seconds(authorization.valid_before());
  if (!valid_after || !valid_before) {
    return malformed("invalid validity window");
  }
  out.valid_after = *valid_after;
  out.valid_before = *valid_before;
  auto nonce = try_make_hash32(authorization.nonce());
  if (!nonce) {
    return malformed("nonce must be 32 bytes of hex");
  }
  out.nonce = *nonce;
  auto signature = try_parse_signature(network->family, body.signature());
  if (!signature || signature->empty()) {
    return malformed("invalid signature encoding");
  }
  out.signature = std::move(*signature);
  return out;
}

tollbooth::v1::PaymentPayload to_proto(
    const payment_authorization_t& authorization) {
  auto family = authorization.network.family;
  auto out = tollbooth::v1::PaymentPayload{};
  out.set_x402_version(kX402Version);
  out.set_scheme(std::string{to_string(authorization.scheme)});
  out.set_network(authorization.network.name);
  auto* payload = out.mutable_payload();
  payload->set_signature(format_signature(family, authorization.signature));
  auto* body = payload->mutable_authorization();
  body->set_from(format_address(family, authorization.payer));
  body->set_to(format_address(family, authorization.payee));
  body->set_value(to_decimal(authorization.amount));
  body->set_valid_after(std::to_string(authorization.valid_after));
  body->set_valid_before(std::to_string(authorization.valid_before));
  body->set_nonce(to_hex_prefixed(authorization.nonce));
  return out;
}

requirement_result_t to_requirement(
    const tollbooth::v1::PaymentRequirements& requirements,
    const network_resolver_fn& resolve) {
  auto scheme = try_from_string<payment_scheme>(requirements.scheme());
  if (!scheme) {
    return invalid("unknown scheme '" + requirements.scheme() + "'");
  }
  auto network = resolve(requirements.network());
  if (!network) {
    return failure{.code = error_code::unsupported_network,
                   .reason = "unknown network '" + requirements.network() + "'"};
  }
  auto amount = try_parse_amount(requirements.max_amount_required());
  if (!amount) {
    return invalid("invalid maxAmountRequired");
  }
  auto pay_to = try_parse_address(network->family, requirements.pay_to());
  if (!pay_to) {
    return invalid("invalid payTo address");
  }
  auto asset = try_parse_address(network->family, requirements.asset());
  if (!asset) {
    return invalid("invalid asset");
  }

  auto out = payment_requirement_t{};
  out.scheme = *scheme;
  out.network = *network;
  out.asset = std::move(*asset);
  out.max_amount_required = *amount;
  out.pay_to = std::move(*pay_to);
  out.max_timeout_seconds = requirements.max_timeout_seconds();
  out.resource = requirements.resource();
  out.description = requirements.description();
  out.mime_type = requirements.mime_type();
  if (requirements.has_extra()) {
    if (!requirements.extra().name().empty()) {
      out.eip712_name = requirements.extra().name();
    }
    if (!requirements.extra().version().empty()) {
      out.eip712_version = requirements.extra().version();
    }
  }
  return out;
}

tollbooth::v1::PaymentRequirements to_proto(
    const payment_requirement_t& requirement) {
  auto family = requirement.network.family;
  auto out = tollbooth::v1::PaymentRequirements{};
  out.set_scheme(std::string{to_string(requirement.scheme)});
  out.set_network(requirement.network.name);
  out.set_max_amount_required(to_decimal(requirement.max_amount_required));
  out.set_resource(requirement.resource);
  out.set_description(requirement.description);
  out.set_mime_type(requirement.mime_type);
  out.set_pay_to(format_address(family, requirement.pay_to));
  out.set_max_timeout_seconds(static_cast<uint32_t>(
      std::min<uint64_t>(requirement.max_timeout_seconds,
                         std::numeric_limits<uint32_t>::max())));
  out.set_asset(format_address(family, requirement.asset));
  if (family == chain_family::evm) {
    out.mutable_extra()->set_name(requirement.eip712_name);
    out.mutable_extra()->set_version(requirement.eip712_version);
  }
  return out;
}

tollbooth::v1::PaymentRecord to_proto(const payment_record_t& record) {
  auto family = record.authorization.network.family;
  auto out = tollbooth::v1::PaymentRecord{};
  out.set_payment_id(to_hex_prefixed(record.id));
  out.set_status(std::string{to_string(record.status)});
  out.set_network(record.authorization.network.name);
  out.set_scheme(std::string{to_string(record.authorization.scheme)});
  out.set_payer(format_address(family, record.authorization.payer));
  out.set_payee(format_address(family, record.authorization.payee));
  out.set_amount(to_decimal(record.authorization.amount));
  out.set_resource(record.requirement.resource);
  if (record.transaction_ref) {
    out.set_transaction(*record.transaction_ref);
  }
  out.set_confirmations(record.confirmations);
  out.set_attempts(record.attempts);
  if (record.failure_code != error_code::none) {
    out.set_failure_code(std::string{to_string(record.failure_code)});
  }
  out.set_failure_reason(record.failure_reason);
  out.set_created_at(record.created_at);
  out.set_updated_at(record.updated_at);
  out.set_deadline(record.deadline);
  out.set_fee(to_decimal(record.fee));
  return out;
}

std::optional<tollbooth::v1::PaymentPayload> decode_header_payload(
    const std::string_view header) {
  auto json = try_from_base64(header);
  if (!json) {
    return std::nullopt;
  }
  auto out = tollbooth::v1::PaymentPayload{};
  auto options = google::protobuf::util::JsonParseOptions{};
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(
      make_string(*json), &out, options);
  if (!status.ok()) {
    return std::nullopt;
  }
  return out;
}

authorization_result_t decode_header(const std::string_view header,
                                     const network_resolver_fn& resolve) {
  auto payload = decode_header_payload(header);
  if (!payload) {
    return malformed("payment header is not base64 encoded JSON");
  }
  return to_authorization(*payload, resolve);
}

std::string encode_header(const payment_authorization_t& authorization) {
  auto json = std::string{};
  auto status =
      google::protobuf::util::MessageToJsonString(to_proto(authorization), &json);
  if (!status.ok()) {
    return {};
  }
  return to_base64(make_bytes_view(json));
}

tollbooth::v1::PaymentRequired make_payment_required(
    const std::span<const payment_requirement_t> accepts,
    const std::string_view error) {
  auto out = tollbooth::v1::PaymentRequired{};
  out.set_x402_version(kX402Version);
  out.set_error(std::string{error});
  for (const auto& requirement : accepts) {
    *out.add_accepts() = to_proto(requirement);
  }
  return out;
}

std::string encode_payment_required(
    const std::span<const payment_requirement_t> accepts,
    const std::string_view error) {
  auto json = std::string{};
  auto status = google::protobuf::util::MessageToJsonString(
      make_payment_required(accepts, error), &json);
  if (!status.ok()) {
    return {};
  }
  return json;
}

std::optional<tollbooth::v1::PaymentRequired> decode_payment_required(
    const std::string_view body) {
  auto out = tollbooth::v1::PaymentRequired{};
  auto options = google::protobuf::util::JsonParseOptions{};
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(std::string{body},
                                                            &out, options);
  if (!status.ok()) {
    return std::nullopt;
  }
  return out;
}

}  // namespace tollbooth::codec
