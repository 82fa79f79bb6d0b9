#pragma once

#include <pledge/v1/service.grpc.pb.h>
#include <pledge/service/service.hpp>

namespace pledge::rpc {

/// gRPC binding of the subscription service. Each RPC runs to completion on
/// the calling gRPC thread and finishes with Status::OK; domain failures are
/// carried in the response's `result` field.
struct listener final : public pledge::v1::Pledge::CallbackService {
  explicit listener(pledge::service::service& service);

  /// Worker identity: on-chain verification status.
  virtual grpc::ServerUnaryReactor* VerifyWorker(
      grpc::CallbackServerContext* context,
      const pledge::v1::VerifyWorkerRequest* request,
      pledge::v1::VerifyWorkerResponse* response) override final;

  /// Worker identity: attested registration with the contract.
  virtual grpc::ServerUnaryReactor* RegisterWorker(
      grpc::CallbackServerContext* context,
      const pledge::v1::RegisterWorkerRequest* request,
      pledge::v1::RegisterWorkerResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ListMerchants(
      grpc::CallbackServerContext* context,
      const pledge::v1::ListMerchantsRequest* request,
      pledge::v1::ListMerchantsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* CreateSubscription(
      grpc::CallbackServerContext* context,
      const pledge::v1::CreateSubscriptionRequest* request,
      pledge::v1::CreateSubscriptionResponse* response) override final;

  virtual grpc::ServerUnaryReactor* RegisterSubscriptionKey(
      grpc::CallbackServerContext* context,
      const pledge::v1::RegisterSubscriptionKeyRequest* request,
      pledge::v1::MessageResponse* response) override final;

  /// Carries private key text. Deploy only behind an attested channel.
  virtual grpc::ServerUnaryReactor* StoreSubscriptionKey(
      grpc::CallbackServerContext* context,
      const pledge::v1::StoreSubscriptionKeyRequest* request,
      pledge::v1::MessageResponse* response) override final;

  virtual grpc::ServerUnaryReactor* PrepareSubscriptionKey(
      grpc::CallbackServerContext* context,
      const pledge::v1::PrepareSubscriptionKeyRequest* request,
      pledge::v1::PrepareSubscriptionKeyResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetSubscription(
      grpc::CallbackServerContext* context,
      const pledge::v1::GetSubscriptionRequest* request,
      pledge::v1::GetSubscriptionResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ListSubscriptions(
      grpc::CallbackServerContext* context,
      const pledge::v1::ListSubscriptionsRequest* request,
      pledge::v1::ListSubscriptionsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* PauseSubscription(
      grpc::CallbackServerContext* context,
      const pledge::v1::SubscriptionActionRequest* request,
      pledge::v1::MessageResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ResumeSubscription(
      grpc::CallbackServerContext* context,
      const pledge::v1::SubscriptionActionRequest* request,
      pledge::v1::MessageResponse* response) override final;

  virtual grpc::ServerUnaryReactor* CancelSubscription(
      grpc::CallbackServerContext* context,
      const pledge::v1::SubscriptionActionRequest* request,
      pledge::v1::MessageResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetChargeHistory(
      grpc::CallbackServerContext* context,
      const pledge::v1::GetChargeHistoryRequest* request,
      pledge::v1::GetChargeHistoryResponse* response) override final;

  /// Idempotent: starting a running monitor reports success.
  virtual grpc::ServerUnaryReactor* StartMonitoring(
      grpc::CallbackServerContext* context,
      const pledge::v1::StartMonitoringRequest* request,
      pledge::v1::MonitoringControlResponse* response) override final;

  virtual grpc::ServerUnaryReactor* StopMonitoring(
      grpc::CallbackServerContext* context,
      const pledge::v1::StopMonitoringRequest* request,
      pledge::v1::MonitoringControlResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetMonitoringStatus(
      grpc::CallbackServerContext* context,
      const pledge::v1::GetMonitoringStatusRequest* request,
      pledge::v1::GetMonitoringStatusResponse* response) override final;

  pledge::service::service& service_;
};

}  // namespace pledge::rpc
