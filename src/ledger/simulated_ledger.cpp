#include <spdlog/spdlog.h>
#include <pledge/blake3/hash.hpp>
#include <pledge/crypto/ed25519.hpp>
#include <pledge/crypto/verify.hpp>
#include <pledge/ledger/signing.hpp>
#include <pledge/ledger/simulated_ledger.hpp>
#include <pledge/schema/attestation_quote.hpp>
#include <pledge/vault/software_enclave.hpp>

#include <algorithm>
#include <thread>

namespace pledge::ledger {

namespace {

using pledge::schema::error_code;

pledge::schema::operation_result_t ledger_error(const error_code code,
                                                std::string log) {
  return pledge::schema::make_error(code, std::move(log),
                                    std::string{kLedgerCodespace});
}

bool permits_method(const pledge::schema::function_call_permission_t& permission,
                    const std::string_view method) {
  return permission.method_names.empty() ||
         std::ranges::find(permission.method_names, method) !=
             permission.method_names.end();
}

}  // namespace

simulated_ledger::simulated_ledger(simulated_ledger_options options)
    : options_{std::move(options)} {}

submission_result simulated_ledger::reject(std::string message) const {
  spdlog::debug("Ledger rejected transaction: {}", message);
  return submission_result{.status = submission_status_t::rejected,
                           .transaction_hash = std::nullopt,
                           .message = std::move(message)};
}

submission_result simulated_ledger::submit(
    const pledge::schema::signed_transaction_t& transaction,
    const std::chrono::milliseconds timeout) {
  if (unreachable_.load()) {
    return reject("ledger unreachable");
  }
  auto latency = std::chrono::milliseconds{latency_ms_.load()};
  if (latency > timeout) {
    std::this_thread::sleep_for(timeout);
    return submission_result{.status = submission_status_t::timeout,
                             .transaction_hash = std::nullopt,
                             .message = "ledger did not respond in time"};
  }
  if (latency.count() > 0) {
    std::this_thread::sleep_for(latency);
  }
  return execute(transaction);
}

submission_result simulated_ledger::execute(
    const pledge::schema::signed_transaction_t& signed) {
  const auto& transaction = signed.transaction;
  if (!transaction.public_key) {
    return reject("transaction carries no signer key");
  }
  if (transaction.actions.empty()) {
    return reject("transaction has no actions");
  }
  auto payload = make_signing_payload(encoder_, transaction);
  if (!pledge::crypto::verify_signature(payload, *transaction.public_key,
                                        signed.signature)) {
    return reject("invalid signature");
  }

  auto lock = std::scoped_lock{mutex_};
  auto account = accounts_.find(transaction.signer_id);
  if (account == accounts_.end()) {
    return reject("signer account does not exist");
  }
  auto key = account->second.keys.find(*transaction.public_key);
  if (key == account->second.keys.end()) {
    return reject("access key not found");
  }
  if (transaction.nonce <= key->second.nonce) {
    return reject("invalid nonce");
  }

  auto& permission = key->second.permission;
  if (permission) {
    if (transaction.actions.size() != 1 ||
        !std::holds_alternative<pledge::schema::function_call_action_t>(
            transaction.actions.front())) {
      return reject("function-call key may only sign a single function call");
    }
    const auto& call = std::get<pledge::schema::function_call_action_t>(
        transaction.actions.front());
    if (transaction.receiver_id != permission->receiver_id) {
      return reject("receiver not permitted for access key");
    }
    if (!permits_method(*permission, call.method_name)) {
      return reject("method not permitted for access key");
    }
    if (call.deposit != 0) {
      return reject("function-call key cannot attach a deposit");
    }
    auto fee = pledge::schema::amount_t{call.gas} * options_.gas_price;
    if (permission->allowance && *permission->allowance < fee) {
      return reject("access key allowance exhausted");
    }
    key->second.nonce = transaction.nonce;
    if (permission->allowance) {
      *permission->allowance -= fee;
    }
  } else {
    for (const auto& action : transaction.actions) {
      if (const auto* add =
              std::get_if<pledge::schema::add_key_action_t>(&action)) {
        if (transaction.receiver_id != transaction.signer_id) {
          return reject("keys can only be added to the signer account");
        }
        if (account->second.keys.contains(add->public_key)) {
          return reject("access key already exists");
        }
      }
    }
    key->second.nonce = transaction.nonce;
  }

  auto transaction_hash = make_transaction_hash(encoder_, signed);
  for (const auto& action : transaction.actions) {
    auto failure = std::visit(
        overloaded{
            [&](const pledge::schema::add_key_action_t& add)
                -> std::optional<std::string> {
              account->second.keys.emplace(
                  add.public_key,
                  access_key_entry{.nonce = add.access_key.nonce,
                                   .permission = add.access_key.permission});
              spdlog::debug("Ledger added access key {} to {}",
                            pledge::crypto::to_string(add.public_key),
                            transaction.signer_id);
              return std::nullopt;
            },
            [&](const pledge::schema::function_call_action_t& call)
                -> std::optional<std::string> {
              if (transaction.receiver_id != options_.contract_id) {
                return std::string{"receiver has no deployed contract"};
              }
              return call_contract(transaction.signer_id,
                                   *transaction.public_key, call);
            }},
        action);
    if (failure) {
      auto result = reject(*failure);
      result.transaction_hash = transaction_hash;
      return result;
    }
  }

  return submission_result{.status = submission_status_t::confirmed,
                           .transaction_hash = transaction_hash,
                           .message = "confirmed"};
}

std::optional<std::string> simulated_ledger::call_contract(
    const pledge::schema::account_id_t& caller,
    const pledge::schema::ed25519_public_key_t& caller_key,
    const pledge::schema::function_call_action_t& call) {
  if (call.method_name != pledge::schema::kProcessPaymentMethod) {
    return "method " + call.method_name + " not found";
  }
  auto args =
      encoder_.try_decode<pledge::schema::process_payment_args_t>(call.args);
  if (!args) {
    return std::string{"malformed process_payment arguments"};
  }
  auto binding = subscriptions_.find(args->subscription_id);
  if (binding == subscriptions_.end()) {
    return std::string{"subscription is not registered"};
  }
  if (binding->second.payer_account_id != caller ||
      binding->second.public_key != caller_key) {
    return std::string{"key is not bound to subscription"};
  }
  if (args->amount != binding->second.amount ||
      args->token_address != binding->second.token_address) {
    return std::string{"payment does not match subscription terms"};
  }
  auto merchant = merchants_.find(binding->second.merchant_id);
  if (merchant == merchants_.end()) {
    return std::string{"merchant no longer exists"};
  }
  auto& payer_balance = balances_[caller];
  if (payer_balance < args->amount) {
    return std::string{"insufficient balance"};
  }
  payer_balance -= args->amount;
  balances_[merchant->second.payee_account_id] += args->amount;
  binding->second.payments += 1;
  return std::nullopt;
}

std::optional<uint64_t> simulated_ledger::access_key_nonce(
    const pledge::schema::account_id_t& account_id,
    const pledge::schema::ed25519_public_key_t& public_key) {
  if (unreachable_.load()) {
    return std::nullopt;
  }
  auto lock = std::scoped_lock{mutex_};
  auto account = accounts_.find(account_id);
  if (account == accounts_.end()) {
    return std::nullopt;
  }
  auto key = account->second.keys.find(public_key);
  if (key == account->second.keys.end()) {
    return std::nullopt;
  }
  return key->second.nonce;
}

pledge::schema::operation_result_t simulated_ledger::register_subscription_key(
    const pledge::schema::subscription_state_t& subscription,
    const pledge::schema::ed25519_public_key_t& public_key) {
  if (unreachable_.load()) {
    return ledger_error(error_code::ledger_rejected, "ledger unreachable");
  }
  auto lock = std::scoped_lock{mutex_};
  auto existing = subscriptions_.find(subscription.id);
  if (existing != subscriptions_.end()) {
    if (existing->second.public_key == public_key) {
      return pledge::schema::make_ok("subscription key already registered");
    }
    return ledger_error(error_code::already_exists,
                        "subscription already bound to another key");
  }
  if (!merchants_.contains(subscription.merchant_id)) {
    return ledger_error(error_code::ledger_rejected, "unknown merchant");
  }
  auto account = accounts_.find(subscription.payer_account_id);
  if (account == accounts_.end()) {
    return ledger_error(error_code::ledger_rejected,
                        "payer account does not exist");
  }
  auto key = account->second.keys.find(public_key);
  if (key == account->second.keys.end()) {
    return ledger_error(error_code::ledger_rejected,
                        "key is not installed on payer account");
  }
  const auto& permission = key->second.permission;
  if (!permission || permission->receiver_id != options_.contract_id ||
      !permits_method(*permission, pledge::schema::kProcessPaymentMethod)) {
    return ledger_error(error_code::ledger_rejected,
                        "key is not scoped to process_payment");
  }

  subscriptions_.emplace(
      subscription.id,
      subscription_binding{.payer_account_id = subscription.payer_account_id,
                           .merchant_id = subscription.merchant_id,
                           .amount = subscription.amount,
                           .token_address = subscription.token_address,
                           .public_key = public_key});
  spdlog::debug("Ledger bound {} to subscription {}",
                pledge::crypto::to_string(public_key), subscription.id);
  return pledge::schema::make_ok("subscription key registered");
}

pledge::schema::operation_result_t simulated_ledger::register_worker(
    const pledge::schema::account_id_t& account_id,
    const pledge::schema::bytes_t& quote,
    const pledge::schema::hash32_t& measurement) {
  if (unreachable_.load()) {
    return ledger_error(error_code::ledger_rejected, "ledger unreachable");
  }
  auto decoded =
      encoder_.try_decode<pledge::schema::attestation_quote_t>(quote);
  if (!decoded) {
    return ledger_error(error_code::registration_failed, "malformed quote");
  }
  if (decoded->measurement != measurement ||
      decoded->mac !=
          pledge::vault::make_quote_mac(measurement, decoded->report_data)) {
    return ledger_error(error_code::registration_failed,
                        "quote does not verify");
  }
  if (decoded->report_data != pledge::blake3::hash(account_id)) {
    return ledger_error(error_code::registration_failed,
                        "quote is not bound to worker account");
  }
  if (std::ranges::find(options_.allowed_measurements, measurement) ==
      options_.allowed_measurements.end()) {
    return ledger_error(error_code::registration_failed,
                        "measurement is not allow-listed");
  }
  auto lock = std::scoped_lock{mutex_};
  verified_workers_.insert(account_id);
  spdlog::debug("Ledger registered worker {}", account_id);
  return pledge::schema::make_ok("worker registered");
}

std::optional<bool> simulated_ledger::is_worker_verified(
    const pledge::schema::account_id_t& account_id) {
  if (unreachable_.load()) {
    return std::nullopt;
  }
  auto lock = std::scoped_lock{mutex_};
  return verified_workers_.contains(account_id);
}

pledge::schema::value_result<std::vector<pledge::schema::merchant_t>>
simulated_ledger::list_merchants() {
  using result_t = std::vector<pledge::schema::merchant_t>;
  if (unreachable_.load()) {
    return pledge::schema::make_value_error<result_t>(
        error_code::ledger_rejected, "ledger unreachable",
        std::string{kLedgerCodespace});
  }
  auto lock = std::scoped_lock{mutex_};
  auto out = result_t{};
  out.reserve(merchants_.size());
  for (const auto& [id, merchant] : merchants_) {
    out.push_back(merchant);
  }
  return pledge::schema::make_value(std::move(out));
}

void simulated_ledger::create_account(
    const pledge::schema::account_id_t& account_id,
    const pledge::schema::ed25519_public_key_t& public_key) {
  auto lock = std::scoped_lock{mutex_};
  accounts_[account_id].keys[public_key] = access_key_entry{};
}

void simulated_ledger::add_merchant(const pledge::schema::merchant_t& merchant) {
  auto lock = std::scoped_lock{mutex_};
  merchants_[merchant.id] = merchant;
}

void simulated_ledger::deposit(const pledge::schema::account_id_t& account_id,
                               const pledge::schema::amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  balances_[account_id] += amount;
}

pledge::schema::amount_t simulated_ledger::balance(
    const pledge::schema::account_id_t& account_id) {
  auto lock = std::scoped_lock{mutex_};
  auto it = balances_.find(account_id);
  return it == balances_.end() ? pledge::schema::amount_t{0} : it->second;
}

std::optional<pledge::schema::amount_t> simulated_ledger::remaining_allowance(
    const pledge::schema::account_id_t& account_id,
    const pledge::schema::ed25519_public_key_t& public_key) {
  auto lock = std::scoped_lock{mutex_};
  auto account = accounts_.find(account_id);
  if (account == accounts_.end()) {
    return std::nullopt;
  }
  auto key = account->second.keys.find(public_key);
  if (key == account->second.keys.end() || !key->second.permission) {
    return std::nullopt;
  }
  return key->second.permission->allowance;
}

uint32_t simulated_ledger::payment_count(
    const pledge::schema::subscription_id_t& subscription_id) {
  auto lock = std::scoped_lock{mutex_};
  auto it = subscriptions_.find(subscription_id);
  return it == subscriptions_.end() ? 0 : it->second.payments;
}

void simulated_ledger::set_latency(const std::chrono::milliseconds latency) {
  latency_ms_.store(latency.count());
}

void simulated_ledger::set_unreachable(const bool unreachable) {
  unreachable_.store(unreachable);
}

}  // namespace pledge::ledger
