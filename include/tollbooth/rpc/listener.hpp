#pragma once

#include <tollbooth/service/facilitator.hpp>
#include <tollbooth/service/worker_pool.hpp>
#include <tollbooth/v1/facilitator.grpc.pb.h>

namespace tollbooth::rpc {

/// Callback-style gRPC front end over one facilitator instance.
///
/// - Verify: check an authorization without reserving it.
/// - Settle: settle at most once; repeated calls return the current record.
///   Runs on `workers`, since settling waits on the chain between retries.
/// - GetPayment: ledger lookup by payment id.
/// - ListPayments: ledger lookup by payer or payee, newest first.
/// - Supported: (scheme, network) kinds this instance settles.
/// - DeclareRequirement / LookupRequirements / ListRequirements: requirement
///   registry.
struct listener final : public tollbooth::v1::Facilitator::CallbackService {
  listener(tollbooth::service::facilitator& facilitator,
           tollbooth::service::worker_pool& workers);

  virtual grpc::ServerUnaryReactor* Verify(
      grpc::CallbackServerContext* context,
      const tollbooth::v1::VerifyRequest* request,
      tollbooth::v1::VerifyResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Settle(
      grpc::CallbackServerContext* context,
      const tollbooth::v1::SettleRequest* request,
      tollbooth::v1::SettleResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetPayment(
      grpc::CallbackServerContext* context,
      const tollbooth::v1::GetPaymentRequest* request,
      tollbooth::v1::GetPaymentResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Supported(
      grpc::CallbackServerContext* context,
      const tollbooth::v1::SupportedRequest* request,
      tollbooth::v1::SupportedResponse* response) override final;

  virtual grpc::ServerUnaryReactor* DeclareRequirement(
      grpc::CallbackServerContext* context,
      const tollbooth::v1::DeclareRequirementRequest* request,
      tollbooth::v1::DeclareRequirementResponse* response) override final;

  virtual grpc::ServerUnaryReactor* LookupRequirements(
      grpc::CallbackServerContext* context,
      const tollbooth::v1::LookupRequirementsRequest* request,
      tollbooth::v1::LookupRequirementsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ListRequirements(
      grpc::CallbackServerContext* context,
      const tollbooth::v1::ListRequirementsRequest* request,
      tollbooth::v1::ListRequirementsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ListPayments(
      grpc::CallbackServerContext* context,
      const tollbooth::v1::ListPaymentsRequest* request,
      tollbooth::v1::ListPaymentsResponse* response) override final;

  tollbooth::service::facilitator& facilitator_;
  tollbooth::service::worker_pool& workers_;
};

}  // namespace tollbooth::rpc
