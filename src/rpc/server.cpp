#include <spdlog/spdlog.h>
#include <pledge/crypto/ed25519.hpp>
#include <pledge/rpc/server.hpp>
#include <pledge/schema/encoding/scale/encoder.hpp>
#include <optional>
#include <string>

using namespace pledge::rpc;
using namespace pledge::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

void to_proto(const operation_result_t& result, pledge::v1::Result* out) {
  out->set_code(static_cast<uint32_t>(result.code));
  out->set_codespace(result.codespace);
  out->set_log(result.log);
}

void to_proto(const subscription_state_t& state, pledge::v1::Subscription* out) {
  out->set_id(state.id);
  out->set_merchant_id(state.merchant_id);
  out->set_payer_account_id(state.payer_account_id);
  out->set_amount(to_string(state.amount));
  out->set_frequency_seconds(state.frequency_seconds);
  if (state.max_payments) {
    out->set_max_payments(*state.max_payments);
  }
  out->set_payments_made(state.payments_made);
  out->set_status(std::string{to_string(state.status)});
  if (state.next_charge_at) {
    out->set_next_charge_at(*state.next_charge_at);
  }
  if (state.token_address) {
    out->set_token_address(*state.token_address);
  }
  if (state.authorized_public_key) {
    out->set_authorized_public_key(
        pledge::crypto::to_string(*state.authorized_public_key));
  }
  out->set_created_at(state.created_at);
  if (state.last_charged_at) {
    out->set_last_charged_at(*state.last_charged_at);
  }
  out->set_consecutive_failures(state.consecutive_failures);
  out->set_needs_review(state.needs_review);
  if (state.last_failure) {
    out->set_last_failure(*state.last_failure);
  }
}

void to_proto(const monitoring_status_t& status,
              pledge::v1::MonitoringStatus* out) {
  out->set_is_monitoring(status.is_monitoring);
  out->set_interval_ms(status.interval_ms);
  if (status.last_run_at) {
    out->set_last_run_at(*status.last_run_at);
  }
  if (status.last_error) {
    out->set_last_error(*status.last_error);
  }
}

void to_message_response(const operation_result_t& result,
                         std::string success_message,
                         pledge::v1::MessageResponse* response) {
  to_proto(result, response->mutable_result());
  response->set_success(result.ok());
  response->set_message(result.ok() ? std::move(success_message) : result.log);
}

}  // namespace

listener::listener(pledge::service::service& service) : service_{service} {}

grpc::ServerUnaryReactor* listener::VerifyWorker(
    grpc::CallbackServerContext* context,
    const pledge::v1::VerifyWorkerRequest*,
    pledge::v1::VerifyWorkerResponse* response) {
  auto status = service_.verify_worker();
  to_proto(status.result, response->mutable_result());
  if (status.value) {
    response->set_verified(status.value->verified);
    response->set_account_id(status.value->account_id);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::RegisterWorker(
    grpc::CallbackServerContext* context,
    const pledge::v1::RegisterWorkerRequest*,
    pledge::v1::RegisterWorkerResponse* response) {
  auto status = service_.register_worker();
  to_proto(status.result, response->mutable_result());
  response->set_registered(status.ok());
  if (status.value) {
    response->set_account_id(status.value->account_id);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListMerchants(
    grpc::CallbackServerContext* context,
    const pledge::v1::ListMerchantsRequest*,
    pledge::v1::ListMerchantsResponse* response) {
  auto merchants = service_.list_merchants();
  to_proto(merchants.result, response->mutable_result());
  if (merchants.value) {
    for (const auto& merchant : *merchants.value) {
      auto* out = response->add_merchants();
      out->set_id(merchant.id);
      out->set_name(merchant.name);
      out->set_payee_account_id(merchant.payee_account_id);
    }
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CreateSubscription(
    grpc::CallbackServerContext* context,
    const pledge::v1::CreateSubscriptionRequest* request,
    pledge::v1::CreateSubscriptionResponse* response) {
  auto amount = try_make_amount(request->amount());
  if (!amount) {
    to_proto(make_error(error_code::invalid_parameters,
                        "amount must be a non-negative decimal integer",
                        std::string{pledge::service::kServiceCodespace}),
             response->mutable_result());
    return finish_ok(context);
  }

  auto created = service_.create_subscription(pledge::subscription::create_request{
      .merchant_id = request->merchant_id(),
      .payer_account_id = request->payer_account_id(),
      .amount = *amount,
      .frequency_seconds = request->frequency_seconds(),
      .max_payments = request->has_max_payments()
                          ? std::optional<int64_t>{request->max_payments()}
                          : std::nullopt,
      .token_address = request->has_token_address()
                           ? std::optional<std::string>{request->token_address()}
                           : std::nullopt});
  to_proto(created.result, response->mutable_result());
  if (created.value) {
    response->set_subscription_id(created.value->id);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::RegisterSubscriptionKey(
    grpc::CallbackServerContext* context,
    const pledge::v1::RegisterSubscriptionKeyRequest* request,
    pledge::v1::MessageResponse* response) {
  auto registered = service_.register_subscription_key(
      request->subscription_id(), request->public_key());
  to_message_response(registered.result, "subscription key registered",
                      response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::StoreSubscriptionKey(
    grpc::CallbackServerContext* context,
    const pledge::v1::StoreSubscriptionKeyRequest* request,
    pledge::v1::MessageResponse* response) {
  auto stored = service_.store_subscription_key(
      request->subscription_id(), request->private_key(),
      request->public_key());
  to_message_response(stored, "subscription key stored", response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::PrepareSubscriptionKey(
    grpc::CallbackServerContext* context,
    const pledge::v1::PrepareSubscriptionKeyRequest* request,
    pledge::v1::PrepareSubscriptionKeyResponse* response) {
  auto allowance = std::optional<amount_t>{};
  if (request->has_allowance()) {
    allowance = try_make_amount(request->allowance());
    if (!allowance) {
      to_proto(make_error(error_code::invalid_parameters,
                          "allowance must be a non-negative decimal integer",
                          std::string{pledge::service::kServiceCodespace}),
               response->mutable_result());
      return finish_ok(context);
    }
  }

  auto prepared =
      service_.prepare_subscription_key(request->subscription_id(), allowance);
  to_proto(prepared.result, response->mutable_result());
  if (prepared.value) {
    auto encoder = encoding::scale_encoder_t{};
    auto encoded = encoder.encode(prepared.value->transaction);
    response->set_public_key(
        pledge::crypto::to_string(prepared.value->public_key));
    response->set_transaction(std::string{encoded.begin(), encoded.end()});
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetSubscription(
    grpc::CallbackServerContext* context,
    const pledge::v1::GetSubscriptionRequest* request,
    pledge::v1::GetSubscriptionResponse* response) {
  auto subscription = service_.get_subscription(request->subscription_id());
  to_proto(subscription.result, response->mutable_result());
  if (subscription.value) {
    to_proto(*subscription.value, response->mutable_subscription());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListSubscriptions(
    grpc::CallbackServerContext* context,
    const pledge::v1::ListSubscriptionsRequest* request,
    pledge::v1::ListSubscriptionsResponse* response) {
  to_proto(make_ok(), response->mutable_result());
  for (const auto& subscription :
       service_.list_subscriptions(request->account_id())) {
    to_proto(subscription, response->add_subscriptions());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::PauseSubscription(
    grpc::CallbackServerContext* context,
    const pledge::v1::SubscriptionActionRequest* request,
    pledge::v1::MessageResponse* response) {
  auto paused = service_.pause(request->subscription_id());
  to_message_response(paused.result, "subscription paused", response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ResumeSubscription(
    grpc::CallbackServerContext* context,
    const pledge::v1::SubscriptionActionRequest* request,
    pledge::v1::MessageResponse* response) {
  auto resumed = service_.resume(request->subscription_id());
  to_message_response(resumed.result, "subscription resumed", response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CancelSubscription(
    grpc::CallbackServerContext* context,
    const pledge::v1::SubscriptionActionRequest* request,
    pledge::v1::MessageResponse* response) {
  auto cancelled = service_.cancel(request->subscription_id());
  to_message_response(cancelled.result, "subscription cancelled", response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetChargeHistory(
    grpc::CallbackServerContext* context,
    const pledge::v1::GetChargeHistoryRequest* request,
    pledge::v1::GetChargeHistoryResponse* response) {
  auto history = service_.history(request->subscription_id());
  to_proto(history.result, response->mutable_result());
  if (history.value) {
    for (const auto& charge : *history.value) {
      auto* out = response->add_charges();
      out->set_attempt(charge.attempt);
      out->set_attempted_at(charge.attempted_at);
      out->set_success(charge.success);
      out->set_amount(to_string(charge.amount));
      if (charge.transaction_hash) {
        out->set_transaction_hash(to_hex(*charge.transaction_hash));
      }
      out->set_message(charge.message);
    }
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::StartMonitoring(
    grpc::CallbackServerContext* context,
    const pledge::v1::StartMonitoringRequest* request,
    pledge::v1::MonitoringControlResponse* response) {
  auto started = service_.start_monitoring(
      request->has_interval_ms()
          ? std::optional<uint64_t>{request->interval_ms()}
          : std::nullopt);
  to_proto(started.result, response->mutable_result());
  response->set_success(started.ok());
  response->set_message(started.result.log);
  response->set_is_monitoring(service_.monitoring_status().is_monitoring);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::StopMonitoring(
    grpc::CallbackServerContext* context,
    const pledge::v1::StopMonitoringRequest*,
    pledge::v1::MonitoringControlResponse* response) {
  auto stopped = service_.stop_monitoring();
  to_proto(make_ok(), response->mutable_result());
  response->set_success(true);
  response->set_message("monitoring stopped");
  response->set_is_monitoring(stopped.is_monitoring);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetMonitoringStatus(
    grpc::CallbackServerContext* context,
    const pledge::v1::GetMonitoringStatusRequest*,
    pledge::v1::GetMonitoringStatusResponse* response) {
  to_proto(make_ok(), response->mutable_result());
  to_proto(service_.monitoring_status(), response->mutable_status());
  return finish_ok(context);
}
