#include <grpcpp/grpcpp.h>
#include <gtest/gtest.h>
#include <pledge/rpc/server.hpp>
#include <pledge/testing/harness.hpp>
#include <pledge/v1/service.grpc.pb.h>

#include <chrono>
#include <memory>
#include <string>

namespace {

/// In-process gRPC server in front of a test harness.
struct rpc_fixture final {
  explicit rpc_fixture(const std::string_view name)
      : harness{name}, listener{harness.service} {
    auto builder = grpc::ServerBuilder{};
    builder.RegisterService(&listener);
    server = builder.BuildAndStart();
    EXPECT_NE(server, nullptr);
    stub = pledge::v1::Pledge::NewStub(
        server->InProcessChannel(grpc::ChannelArguments{}));
  }

  ~rpc_fixture() {
    harness.monitor.stop();
    server->Shutdown(std::chrono::system_clock::now() +
                     std::chrono::seconds{2});
  }

  pledge::testing::harness harness;
  pledge::rpc::listener listener;
  std::unique_ptr<grpc::Server> server;
  std::unique_ptr<pledge::v1::Pledge::Stub> stub;
};

}  // namespace

TEST(rpc_server, lists_merchants) {
  auto fixture = rpc_fixture{"pledge_rpc_merchants"};
  auto context = grpc::ClientContext{};
  auto response = pledge::v1::ListMerchantsResponse{};
  auto status = fixture.stub->ListMerchants(
      &context, pledge::v1::ListMerchantsRequest{}, &response);
  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(response.result().code(), 0u);
  ASSERT_EQ(response.merchants_size(), 1);
  EXPECT_EQ(response.merchants(0).id(), pledge::testing::kMerchantId);
  EXPECT_EQ(response.merchants(0).payee_account_id(),
            pledge::testing::kMerchantPayee);
}

TEST(rpc_server, malformed_amount_is_an_invalid_parameter) {
  auto fixture = rpc_fixture{"pledge_rpc_amount"};
  auto request = pledge::v1::CreateSubscriptionRequest{};
  request.set_merchant_id(std::string{pledge::testing::kMerchantId});
  request.set_payer_account_id("alice.test");
  request.set_amount("-12");
  request.set_frequency_seconds(86400);

  auto context = grpc::ClientContext{};
  auto response = pledge::v1::CreateSubscriptionResponse{};
  auto status = fixture.stub->CreateSubscription(&context, request, &response);
  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(response.result().code(), 1u);
  EXPECT_TRUE(response.subscription_id().empty());
}

TEST(rpc_server, subscription_activation_over_the_wire) {
  auto fixture = rpc_fixture{"pledge_rpc_activation"};
  fixture.harness.create_payer("alice.test", 10000);

  auto create = pledge::v1::CreateSubscriptionRequest{};
  create.set_merchant_id(std::string{pledge::testing::kMerchantId});
  create.set_payer_account_id("alice.test");
  create.set_amount("1000");
  create.set_frequency_seconds(86400);
  create.set_max_payments(3);
  auto created = pledge::v1::CreateSubscriptionResponse{};
  {
    auto context = grpc::ClientContext{};
    ASSERT_TRUE(
        fixture.stub->CreateSubscription(&context, create, &created).ok());
  }
  ASSERT_EQ(created.result().code(), 0u) << created.result().log();
  auto id = created.subscription_id();

  auto prepare = pledge::v1::PrepareSubscriptionKeyRequest{};
  prepare.set_subscription_id(id);
  auto prepared = pledge::v1::PrepareSubscriptionKeyResponse{};
  {
    auto context = grpc::ClientContext{};
    ASSERT_TRUE(fixture.stub
                    ->PrepareSubscriptionKey(&context, prepare, &prepared)
                    .ok());
  }
  ASSERT_EQ(prepared.result().code(), 0u) << prepared.result().log();
  ASSERT_FALSE(prepared.transaction().empty());

  const auto& raw = prepared.transaction();
  auto transaction =
      fixture.harness.encoder.try_decode<pledge::schema::transaction_t>(
          pledge::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(raw.data()), raw.size()});
  ASSERT_TRUE(transaction.has_value());
  EXPECT_EQ(transaction->signer_id, "alice.test");
  auto installed = fixture.harness.wallet_submit("alice.test", *transaction);
  ASSERT_EQ(installed.status, pledge::ledger::submission_status_t::confirmed)
      << installed.message;

  auto reg = pledge::v1::RegisterSubscriptionKeyRequest{};
  reg.set_subscription_id(id);
  reg.set_public_key(prepared.public_key());
  auto registered = pledge::v1::MessageResponse{};
  {
    auto context = grpc::ClientContext{};
    ASSERT_TRUE(
        fixture.stub->RegisterSubscriptionKey(&context, reg, &registered)
            .ok());
  }
  EXPECT_TRUE(registered.success()) << registered.message();

  auto get = pledge::v1::GetSubscriptionRequest{};
  get.set_subscription_id(id);
  auto fetched = pledge::v1::GetSubscriptionResponse{};
  {
    auto context = grpc::ClientContext{};
    ASSERT_TRUE(fixture.stub->GetSubscription(&context, get, &fetched).ok());
  }
  ASSERT_EQ(fetched.result().code(), 0u);
  EXPECT_EQ(fetched.subscription().status(), "active");
  EXPECT_EQ(fetched.subscription().amount(), "1000");
  EXPECT_EQ(fetched.subscription().max_payments(), 3u);
  EXPECT_EQ(fetched.subscription().authorized_public_key(),
            prepared.public_key());

  auto list = pledge::v1::ListSubscriptionsRequest{};
  list.set_account_id("alice.test");
  auto listed = pledge::v1::ListSubscriptionsResponse{};
  {
    auto context = grpc::ClientContext{};
    ASSERT_TRUE(fixture.stub->ListSubscriptions(&context, list, &listed).ok());
  }
  ASSERT_EQ(listed.subscriptions_size(), 1);
  EXPECT_EQ(listed.subscriptions(0).id(), id);
}

TEST(rpc_server, unknown_subscription_history_is_not_found) {
  auto fixture = rpc_fixture{"pledge_rpc_history"};
  auto request = pledge::v1::GetChargeHistoryRequest{};
  request.set_subscription_id("sub_missing");
  auto context = grpc::ClientContext{};
  auto response = pledge::v1::GetChargeHistoryResponse{};
  ASSERT_TRUE(
      fixture.stub->GetChargeHistory(&context, request, &response).ok());
  EXPECT_EQ(response.result().code(), 2u);
  EXPECT_EQ(response.charges_size(), 0);
}

TEST(rpc_server, monitoring_control) {
  auto fixture = rpc_fixture{"pledge_rpc_monitoring"};

  auto start = pledge::v1::StartMonitoringRequest{};
  start.set_interval_ms(60000);
  auto started = pledge::v1::MonitoringControlResponse{};
  {
    auto context = grpc::ClientContext{};
    ASSERT_TRUE(fixture.stub->StartMonitoring(&context, start, &started).ok());
  }
  EXPECT_TRUE(started.success()) << started.message();
  EXPECT_EQ(started.message(), "monitoring started");
  EXPECT_TRUE(started.is_monitoring());

  auto restarted = pledge::v1::MonitoringControlResponse{};
  {
    auto context = grpc::ClientContext{};
    ASSERT_TRUE(
        fixture.stub->StartMonitoring(&context, start, &restarted).ok());
  }
  EXPECT_TRUE(restarted.success());
  EXPECT_EQ(restarted.message(), "monitoring already running");
  EXPECT_TRUE(restarted.is_monitoring());

  auto status = pledge::v1::GetMonitoringStatusResponse{};
  {
    auto context = grpc::ClientContext{};
    ASSERT_TRUE(fixture.stub
                    ->GetMonitoringStatus(
                        &context, pledge::v1::GetMonitoringStatusRequest{},
                        &status)
                    .ok());
  }
  EXPECT_TRUE(status.status().is_monitoring());
  EXPECT_EQ(status.status().interval_ms(), 60000u);

  auto stopped = pledge::v1::MonitoringControlResponse{};
  {
    auto context = grpc::ClientContext{};
    ASSERT_TRUE(fixture.stub
                    ->StopMonitoring(&context,
                                     pledge::v1::StopMonitoringRequest{},
                                     &stopped)
                    .ok());
  }
  EXPECT_TRUE(stopped.success());
  EXPECT_FALSE(stopped.is_monitoring());
}
