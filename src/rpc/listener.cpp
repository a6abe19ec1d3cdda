#include <tollbooth/codec/payment_codec.hpp>
#include <tollbooth/rpc/listener.hpp>

#include <google/protobuf/util/json_util.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

using namespace tollbooth::rpc;
using namespace tollbooth::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

grpc::ServerUnaryReactor* finish_error(grpc::CallbackServerContext* context,
                                       grpc::StatusCode code,
                                       const std::string& message) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status{code, message});
  return reactor;
}

struct decoded_request final {
  std::optional<payment_authorization_t> authorization;
  std::optional<payment_requirement_t> requirement;
  failure error;
};

template <typename Request>
decoded_request decode(const Request& request,
                       const tollbooth::codec::network_resolver_fn& resolve) {
  auto out = decoded_request{};
  auto authorization =
      request.has_payment_payload()
          ? tollbooth::codec::to_authorization(request.payment_payload(),
                                               resolve)
          : tollbooth::codec::decode_header(request.payment_header(), resolve);
  if (auto* failed = std::get_if<failure>(&authorization)) {
    out.error = std::move(*failed);
    return out;
  }
  auto requirement = tollbooth::codec::to_requirement(
      request.payment_requirements(), resolve);
  if (auto* failed = std::get_if<failure>(&requirement)) {
    out.error = std::move(*failed);
    return out;
  }
  out.authorization = std::move(std::get<payment_authorization_t>(authorization));
  out.requirement = std::move(std::get<payment_requirement_t>(requirement));
  return out;
}

bool is_success(const tollbooth::settlement::settle_result& result) {
  if (result.error != error_code::none) {
    return false;
  }
  return result.status == payment_status::submitted ||
         result.status == payment_status::confirming ||
         result.status == payment_status::settled;
}

}  // namespace

listener::listener(tollbooth::service::facilitator& facilitator,
                   tollbooth::service::worker_pool& workers)
    : facilitator_{facilitator}, workers_{workers} {}

grpc::ServerUnaryReactor* listener::Verify(
    grpc::CallbackServerContext* context,
    const tollbooth::v1::VerifyRequest* request,
    tollbooth::v1::VerifyResponse* response) {
  auto resolve = [this](std::string_view name) {
    return facilitator_.resolve_network(name);
  };
  auto decoded = decode(*request, resolve);
  if (!decoded.authorization) {
    response->set_is_valid(false);
    response->set_error(std::string{to_string(decoded.error.code)});
    response->set_invalid_reason(decoded.error.reason);
    return finish_ok(context);
  }
  auto result = facilitator_.verify(*decoded.authorization, *decoded.requirement);
  response->set_is_valid(result.valid);
  if (result.payer) {
    response->set_payer(
        format_address(decoded.authorization->network.family, *result.payer));
  }
  if (!result.valid) {
    response->set_error(std::string{to_string(result.error)});
    response->set_invalid_reason(result.reason);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Settle(
    grpc::CallbackServerContext* context,
    const tollbooth::v1::SettleRequest* request,
    tollbooth::v1::SettleResponse* response) {
  auto resolve = [this](std::string_view name) {
    return facilitator_.resolve_network(name);
  };
  auto decoded = decode(*request, resolve);
  if (!decoded.authorization) {
    response->set_success(false);
    response->set_error(std::string{to_string(decoded.error.code)});
    response->set_error_reason(decoded.error.reason);
    return finish_ok(context);
  }

  // The request, response and reactor stay alive until Finish.
  auto* reactor = context->DefaultReactor();
  auto posted = workers_.post([this, reactor, response,
                               decoded = std::move(decoded)] {
    const auto& authorization = *decoded.authorization;
    auto result = tollbooth::settlement::settle_result{};
    try {
      result = facilitator_.settle(authorization, *decoded.requirement);
    } catch (const std::exception& e) {
      spdlog::error("settle failed: {}", e.what());
      reactor->Finish(grpc::Status{grpc::StatusCode::INTERNAL, e.what()});
      return;
    }
    response->set_success(is_success(result));
    response->set_status(std::string{to_string(result.status)});
    response->set_payment_id(to_hex_prefixed(result.payment_id));
    if (result.transaction_ref) {
      response->set_transaction(*result.transaction_ref);
    }
    response->set_confirmations(result.confirmations);
    response->set_network(authorization.network.name);
    response->set_payer(
        format_address(authorization.network.family, authorization.payer));
    if (result.error != error_code::none) {
      response->set_error(std::string{to_string(result.error)});
      response->set_error_reason(result.reason);
    }
    reactor->Finish(grpc::Status::OK);
  });
  if (!posted) {
    reactor->Finish(
        grpc::Status{grpc::StatusCode::UNAVAILABLE, "shutting down"});
  }
  return reactor;
}

grpc::ServerUnaryReactor* listener::GetPayment(
    grpc::CallbackServerContext* context,
    const tollbooth::v1::GetPaymentRequest* request,
    tollbooth::v1::GetPaymentResponse* response) {
  auto id = try_make_hash32(request->payment_id());
  if (!id) {
    return finish_error(context, grpc::StatusCode::INVALID_ARGUMENT,
                        "payment_id must be 32 bytes of hex");
  }
  auto record = facilitator_.payment(*id);
  response->set_found(record.has_value());
  if (record) {
    *response->mutable_record() = tollbooth::codec::to_proto(*record);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Supported(
    grpc::CallbackServerContext* context,
    const tollbooth::v1::SupportedRequest*,
    tollbooth::v1::SupportedResponse* response) {
  for (const auto& kind : facilitator_.supported()) {
    auto* out = response->add_kinds();
    out->set_x402_version(tollbooth::codec::kX402Version);
    out->set_scheme(std::string{to_string(kind.scheme)});
    out->set_network(kind.network.name);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::DeclareRequirement(
    grpc::CallbackServerContext* context,
    const tollbooth::v1::DeclareRequirementRequest* request,
    tollbooth::v1::DeclareRequirementResponse* response) {
  auto requirement = tollbooth::codec::to_requirement(
      request->requirement(),
      [this](std::string_view name) { return facilitator_.resolve_network(name); });
  auto result = std::visit(
      overloaded{
          [&](payment_requirement_t& value) {
            return facilitator_.declare(std::move(value));
          },
          [](failure& value) {
            return tollbooth::registry::declare_result_t{std::move(value)};
          },
      },
      requirement);
  if (auto* failed = std::get_if<failure>(&result)) {
    response->set_accepted(false);
    response->set_error(std::string{to_string(failed->code)});
    response->set_reason(failed->reason);
  } else {
    response->set_accepted(true);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::LookupRequirements(
    grpc::CallbackServerContext* context,
    const tollbooth::v1::LookupRequirementsRequest* request,
    tollbooth::v1::LookupRequirementsResponse* response) {
  auto accepts = facilitator_.lookup(request->resource(), request->network());
  auto error = accepts.empty() ? std::string_view{"no payment requirements"}
                               : std::string_view{"payment required"};
  *response->mutable_payment_required() =
      tollbooth::codec::make_payment_required(accepts, error);
  auto json = std::string{};
  auto status = google::protobuf::util::MessageToJsonString(
      response->payment_required(), &json);
  if (!status.ok()) {
    spdlog::error("failed to serialize payment required body for {}",
                  request->resource());
    return finish_error(context, grpc::StatusCode::INTERNAL,
                        "serialization failed");
  }
  response->set_payment_required_json(std::move(json));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListRequirements(
    grpc::CallbackServerContext* context,
    const tollbooth::v1::ListRequirementsRequest* request,
    tollbooth::v1::ListRequirementsResponse* response) {
  auto limit = request->limit() == 0
                   ? tollbooth::registry::requirement_registry::kDefaultPageSize
                   : std::size_t{request->limit()};
  auto page = facilitator_.list_requirements(request->offset(), limit);
  for (const auto& requirement : page.items) {
    *response->add_items() = tollbooth::codec::to_proto(requirement);
  }
  response->set_total(static_cast<uint32_t>(page.total));
  response->set_limit(static_cast<uint32_t>(std::min(
      limit, tollbooth::registry::requirement_registry::kMaxPageSize)));
  response->set_offset(request->offset());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListPayments(
    grpc::CallbackServerContext* context,
    const tollbooth::v1::ListPaymentsRequest* request,
    tollbooth::v1::ListPaymentsResponse* response) {
  auto network = facilitator_.resolve_network(request->network());
  if (!network) {
    return finish_error(context, grpc::StatusCode::INVALID_ARGUMENT,
                        "unknown network " + request->network());
  }
  const auto& text = request->has_payer() ? request->payer() : request->payee();
  auto party = try_parse_address(network->family, text);
  if (!party) {
    return finish_error(context, grpc::StatusCode::INVALID_ARGUMENT,
                        "not a " + std::string{to_string(network->family)} +
                            " address: " + text);
  }
  auto limit = request->limit() == 0
                   ? tollbooth::ledger::payment_ledger::kDefaultQueryLimit
                   : std::size_t{request->limit()};
  auto records = request->has_payer()
                     ? facilitator_.payments_by_payer(*party, limit)
                     : facilitator_.payments_by_payee(*party, limit);
  for (const auto& record : records) {
    *response->add_records() = tollbooth::codec::to_proto(record);
  }
  return finish_ok(context);
}
