#pragma once

#include <pledge/ledger/ledger_client.hpp>
#include <pledge/schema/access_key_permission.hpp>
#include <pledge/schema/encoding/scale/encoder.hpp>

#include <atomic>
#include <map>
#include <mutex>
#include <set>

namespace pledge::ledger {

struct simulated_ledger_options final {
  pledge::schema::account_id_t contract_id;
  std::vector<pledge::schema::hash32_t> allowed_measurements;
  /// Fee charged against a function-call key's allowance per unit of gas.
  pledge::schema::amount_t gas_price{100000000};
};

/// In-process ledger hosting the subscription contract.
///
/// Enforces what the real chain enforces for this service: ed25519
/// signatures over the transaction digest, strictly increasing access key
/// nonces, function-call-only permissions (receiver, method list, no
/// deposit), allowance spending, subscription key bindings, payer balances
/// held by the contract and the attestation measurement allow-list.
class simulated_ledger final : public ledger_client {
 public:
  explicit simulated_ledger(simulated_ledger_options options);

  submission_result submit(
      const pledge::schema::signed_transaction_t& transaction,
      std::chrono::milliseconds timeout) override;
  std::optional<uint64_t> access_key_nonce(
      const pledge::schema::account_id_t& account_id,
      const pledge::schema::ed25519_public_key_t& public_key) override;
  pledge::schema::operation_result_t register_subscription_key(
      const pledge::schema::subscription_state_t& subscription,
      const pledge::schema::ed25519_public_key_t& public_key) override;
  pledge::schema::operation_result_t register_worker(
      const pledge::schema::account_id_t& account_id,
      const pledge::schema::bytes_t& quote,
      const pledge::schema::hash32_t& measurement) override;
  std::optional<bool> is_worker_verified(
      const pledge::schema::account_id_t& account_id) override;
  pledge::schema::value_result<std::vector<pledge::schema::merchant_t>>
  list_merchants() override;

  /// Create an account controlled by a full-access key.
  void create_account(const pledge::schema::account_id_t& account_id,
                      const pledge::schema::ed25519_public_key_t& public_key);
  void add_merchant(const pledge::schema::merchant_t& merchant);
  /// Prepay the contract on behalf of a payer.
  void deposit(const pledge::schema::account_id_t& account_id,
               const pledge::schema::amount_t& amount);
  pledge::schema::amount_t balance(
      const pledge::schema::account_id_t& account_id);
  std::optional<pledge::schema::amount_t> remaining_allowance(
      const pledge::schema::account_id_t& account_id,
      const pledge::schema::ed25519_public_key_t& public_key);
  /// Number of process_payment calls executed for a subscription.
  uint32_t payment_count(
      const pledge::schema::subscription_id_t& subscription_id);

  void set_latency(std::chrono::milliseconds latency);
  void set_unreachable(bool unreachable);

 private:
  struct access_key_entry final {
    uint64_t nonce{};
    /// std::nullopt for full-access keys.
    std::optional<pledge::schema::function_call_permission_t> permission;
  };

  struct account_entry final {
    std::map<pledge::schema::ed25519_public_key_t, access_key_entry> keys;
  };

  struct subscription_binding final {
    pledge::schema::account_id_t payer_account_id;
    pledge::schema::merchant_id_t merchant_id;
    pledge::schema::amount_t amount{};
    std::optional<std::string> token_address;
    pledge::schema::ed25519_public_key_t public_key{};
    uint32_t payments{};
  };

  submission_result reject(std::string message) const;
  submission_result execute(
      const pledge::schema::signed_transaction_t& transaction);
  std::optional<std::string> call_contract(
      const pledge::schema::account_id_t& caller,
      const pledge::schema::ed25519_public_key_t& caller_key,
      const pledge::schema::function_call_action_t& call);

  simulated_ledger_options options_;
  pledge::schema::encoding::scale_encoder_t encoder_;
  std::map<pledge::schema::account_id_t, account_entry> accounts_;
  std::map<pledge::schema::merchant_id_t, pledge::schema::merchant_t>
      merchants_;
  std::map<pledge::schema::account_id_t, pledge::schema::amount_t> balances_;
  std::map<pledge::schema::subscription_id_t, subscription_binding>
      subscriptions_;
  std::set<pledge::schema::account_id_t> verified_workers_;
  std::atomic<int64_t> latency_ms_{0};
  std::atomic<bool> unreachable_{false};
  std::mutex mutex_;
};

}  // namespace pledge::ledger
