#include <spdlog/spdlog.h>
#include <pledge/crypto/ed25519.hpp>
#include <pledge/service/service.hpp>

#include <algorithm>

namespace pledge::service {

namespace {

using pledge::schema::error_code;
using pledge::schema::subscription_state_t;
using pledge::schema::subscription_status_t;

template <typename T>
pledge::schema::value_result<T> service_error(const error_code code,
                                              std::string log) {
  return pledge::schema::make_value_error<T>(code, std::move(log),
                                             std::string{kServiceCodespace});
}

// Cancel or completion may land between the state check and the vault write;
// their key retirement then found nothing to destroy.
pledge::schema::operation_result_t release_if_retired(
    pledge::subscription::subscription_store& store,
    pledge::vault::key_vault& vault,
    const pledge::schema::subscription_id_t& id) {
  auto current = store.get(id);
  if (current.ok() && !pledge::schema::is_terminal(current.value->status)) {
    return pledge::schema::make_ok();
  }
  vault.destroy(id);
  spdlog::warn("Subscription {} ended while its key was stored; key destroyed",
               id);
  return pledge::schema::make_error(error_code::invalid_state,
                                    "subscription is no longer chargeable",
                                    std::string{kServiceCodespace});
}

}  // namespace

service::service(pledge::subscription::subscription_store& store,
                 pledge::vault::key_vault& vault,
                 pledge::issuer::scoped_key_issuer& issuer,
                 pledge::ledger::ledger_client& ledger,
                 pledge::worker::worker_identity& worker,
                 pledge::monitor::payment_monitor& monitor,
                 pledge::schema::account_id_t contract_id)
    : store_{store},
      vault_{vault},
      issuer_{issuer},
      ledger_{ledger},
      worker_{worker},
      monitor_{monitor},
      contract_id_{std::move(contract_id)} {
  store_.set_key_retirement_handler(
      [this](const pledge::schema::subscription_id_t& id) {
        vault_.destroy(id);
      });
}

pledge::schema::value_result<pledge::schema::worker_status_t>
service::verify_worker() {
  return worker_.verify();
}

pledge::schema::value_result<pledge::schema::worker_status_t>
service::register_worker() {
  return worker_.register_worker();
}

pledge::schema::value_result<std::vector<pledge::schema::merchant_t>>
service::list_merchants() {
  return ledger_.list_merchants();
}

pledge::schema::value_result<subscription_state_t>
service::create_subscription(
    const pledge::subscription::create_request& request) {
  auto merchants = ledger_.list_merchants();
  if (!merchants.ok()) {
    return pledge::schema::forward_error<subscription_state_t>(
        merchants.result);
  }
  auto known = std::ranges::any_of(
      *merchants.value,
      [&](const auto& merchant) { return merchant.id == request.merchant_id; });
  if (!known) {
    spdlog::warn("Rejected subscription for unknown merchant {}",
                 request.merchant_id);
    return service_error<subscription_state_t>(error_code::not_found,
                                               "merchant not found");
  }
  return store_.create(request);
}

pledge::schema::value_result<subscription_state_t>
service::register_subscription_key(const pledge::schema::subscription_id_t& id,
                                   const std::string_view public_key) {
  auto parsed = pledge::crypto::try_parse_public_key(public_key);
  if (!parsed) {
    return service_error<subscription_state_t>(
        error_code::invalid_parameters, "public key is not ed25519:<base58>");
  }
  auto subscription = store_.get(id);
  if (!subscription.ok()) {
    return subscription;
  }
  if (subscription.value->status != subscription_status_t::pending) {
    return service_error<subscription_state_t>(
        error_code::invalid_state, "subscription key is already registered");
  }
  auto custodied = vault_.public_key(id);
  if (custodied && *custodied != *parsed) {
    return service_error<subscription_state_t>(
        error_code::invalid_parameters,
        "public key does not match the key in custody");
  }

  auto registered = ledger_.register_subscription_key(*subscription.value,
                                                      *parsed);
  if (!registered.ok()) {
    spdlog::warn("Ledger refused key for subscription {}: {}", id,
                 registered.log);
    return pledge::schema::forward_error<subscription_state_t>(registered);
  }
  return store_.authorize(id, *parsed);
}

pledge::schema::operation_result_t service::store_subscription_key(
    const pledge::schema::subscription_id_t& id,
    const std::string_view private_key,
    const std::string_view public_key) {
  auto parsed_public = pledge::crypto::try_parse_public_key(public_key);
  if (!parsed_public) {
    return pledge::schema::make_error(error_code::invalid_parameters,
                                      "public key is not ed25519:<base58>",
                                      std::string{kServiceCodespace});
  }
  auto parsed_private = pledge::crypto::secret_key::try_parse(private_key);
  if (!parsed_private) {
    return pledge::schema::make_error(error_code::invalid_parameters,
                                      "private key is not ed25519:<base58>",
                                      std::string{kServiceCodespace});
  }

  auto subscription = store_.get(id);
  if (!subscription.ok()) {
    return subscription.result;
  }
  if (pledge::schema::is_terminal(subscription.value->status)) {
    return pledge::schema::make_error(
        error_code::invalid_state, "subscription is no longer chargeable",
        std::string{kServiceCodespace});
  }
  const auto& authorized = subscription.value->authorized_public_key;
  if (authorized && *authorized != *parsed_public) {
    return pledge::schema::make_error(
        error_code::invalid_parameters,
        "public key differs from the authorized key",
        std::string{kServiceCodespace});
  }
  auto stored = vault_.store(id, std::move(*parsed_private), *parsed_public);
  if (!stored.ok()) {
    return stored;
  }
  auto retained = release_if_retired(store_, vault_, id);
  if (!retained.ok()) {
    return retained;
  }
  return stored;
}

pledge::schema::value_result<prepared_key> service::prepare_subscription_key(
    const pledge::schema::subscription_id_t& id,
    const std::optional<pledge::schema::amount_t>& allowance) {
  auto subscription = store_.get(id);
  if (!subscription.ok()) {
    return pledge::schema::forward_error<prepared_key>(subscription.result);
  }
  if (subscription.value->status != subscription_status_t::pending) {
    return service_error<prepared_key>(error_code::invalid_state,
                                       "subscription is not pending");
  }
  if (vault_.contains(id)) {
    return service_error<prepared_key>(error_code::already_stored,
                                       "key already stored for subscription");
  }

  auto issued = issuer_.issue(subscription.value->payer_account_id, id,
                              contract_id_, allowance);
  if (!issued.ok()) {
    return pledge::schema::forward_error<prepared_key>(issued.result);
  }
  auto public_key = issued.value->key.public_key();
  auto stored = vault_.store(id, std::move(issued.value->key), public_key);
  if (!stored.ok()) {
    return pledge::schema::forward_error<prepared_key>(stored);
  }
  auto retained = release_if_retired(store_, vault_, id);
  if (!retained.ok()) {
    return pledge::schema::forward_error<prepared_key>(retained);
  }
  return pledge::schema::make_value(
      prepared_key{.transaction = std::move(issued.value->transaction),
                   .public_key = public_key});
}

pledge::schema::value_result<subscription_state_t> service::get_subscription(
    const pledge::schema::subscription_id_t& id) {
  return store_.get(id);
}

std::vector<subscription_state_t> service::list_subscriptions(
    const pledge::schema::account_id_t& account_id) {
  return store_.list(account_id);
}

pledge::schema::value_result<subscription_state_t> service::pause(
    const pledge::schema::subscription_id_t& id) {
  return store_.pause(id);
}

pledge::schema::value_result<subscription_state_t> service::resume(
    const pledge::schema::subscription_id_t& id) {
  return store_.resume(id);
}

pledge::schema::value_result<subscription_state_t> service::cancel(
    const pledge::schema::subscription_id_t& id) {
  return store_.cancel(id);
}

pledge::schema::value_result<std::vector<pledge::schema::charge_record_t>>
service::history(const pledge::schema::subscription_id_t& id) {
  auto subscription = store_.get(id);
  if (!subscription.ok()) {
    return pledge::schema::forward_error<
        std::vector<pledge::schema::charge_record_t>>(subscription.result);
  }
  return pledge::schema::make_value(store_.history(id));
}

pledge::schema::value_result<pledge::schema::monitoring_status_t>
service::start_monitoring(const std::optional<uint64_t> interval_ms) {
  return monitor_.start(interval_ms);
}

pledge::schema::monitoring_status_t service::stop_monitoring() {
  return monitor_.stop();
}

pledge::schema::monitoring_status_t service::monitoring_status() {
  return monitor_.status();
}

}  // namespace pledge::service
