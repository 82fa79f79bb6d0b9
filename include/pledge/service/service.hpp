#pragma once

#include <pledge/issuer/scoped_key_issuer.hpp>
#include <pledge/ledger/ledger_client.hpp>
#include <pledge/monitor/payment_monitor.hpp>
#include <pledge/schema/charge_record.hpp>
#include <pledge/schema/merchant.hpp>
#include <pledge/subscription/store.hpp>
#include <pledge/vault/key_vault.hpp>
#include <pledge/worker/worker_identity.hpp>

#include <optional>
#include <string>
#include <vector>

namespace pledge::service {

inline constexpr auto kServiceCodespace = std::string_view{"pledge.service"};

/// Unsigned authorization transaction for a key whose private half was
/// placed directly into custody.
struct prepared_key final {
  pledge::schema::transaction_t transaction;
  pledge::schema::ed25519_public_key_t public_key{};
};

/// Operation surface exposed to the transport layer. Validates requests,
/// parses key text and sequences the store, vault, ledger and monitor.
class service final {
 public:
  service(pledge::subscription::subscription_store& store,
          pledge::vault::key_vault& vault,
          pledge::issuer::scoped_key_issuer& issuer,
          pledge::ledger::ledger_client& ledger,
          pledge::worker::worker_identity& worker,
          pledge::monitor::payment_monitor& monitor,
          pledge::schema::account_id_t contract_id);

  pledge::schema::value_result<pledge::schema::worker_status_t> verify_worker();
  pledge::schema::value_result<pledge::schema::worker_status_t>
  register_worker();

  pledge::schema::value_result<std::vector<pledge::schema::merchant_t>>
  list_merchants();

  pledge::schema::value_result<pledge::schema::subscription_state_t>
  create_subscription(const pledge::subscription::create_request& request);

  /// Bind a wallet-installed scoped key to the subscription on the ledger,
  /// then activate the subscription.
  pledge::schema::value_result<pledge::schema::subscription_state_t>
  register_subscription_key(const pledge::schema::subscription_id_t& id,
                            std::string_view public_key);

  /// Hand a private key to the vault. The key text is parsed and checked
  /// against the public key; it is not logged or kept anywhere else.
  pledge::schema::operation_result_t store_subscription_key(
      const pledge::schema::subscription_id_t& id,
      std::string_view private_key,
      std::string_view public_key);

  /// Issue a scoped key inside the service and take custody of it at once.
  pledge::schema::value_result<prepared_key> prepare_subscription_key(
      const pledge::schema::subscription_id_t& id,
      const std::optional<pledge::schema::amount_t>& allowance);

  pledge::schema::value_result<pledge::schema::subscription_state_t>
  get_subscription(const pledge::schema::subscription_id_t& id);
  std::vector<pledge::schema::subscription_state_t> list_subscriptions(
      const pledge::schema::account_id_t& account_id);

  pledge::schema::value_result<pledge::schema::subscription_state_t> pause(
      const pledge::schema::subscription_id_t& id);
  pledge::schema::value_result<pledge::schema::subscription_state_t> resume(
      const pledge::schema::subscription_id_t& id);
  pledge::schema::value_result<pledge::schema::subscription_state_t> cancel(
      const pledge::schema::subscription_id_t& id);

  pledge::schema::value_result<std::vector<pledge::schema::charge_record_t>>
  history(const pledge::schema::subscription_id_t& id);

  pledge::schema::value_result<pledge::schema::monitoring_status_t>
  start_monitoring(std::optional<uint64_t> interval_ms);
  pledge::schema::monitoring_status_t stop_monitoring();
  pledge::schema::monitoring_status_t monitoring_status();

 private:
  pledge::subscription::subscription_store& store_;
  pledge::vault::key_vault& vault_;
  pledge::issuer::scoped_key_issuer& issuer_;
  pledge::ledger::ledger_client& ledger_;
  pledge::worker::worker_identity& worker_;
  pledge::monitor::payment_monitor& monitor_;
  pledge::schema::account_id_t contract_id_;
};

}  // namespace pledge::service
