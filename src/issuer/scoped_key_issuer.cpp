#include <spdlog/spdlog.h>
#include <pledge/issuer/scoped_key_issuer.hpp>

namespace pledge::issuer {

using pledge::schema::error_code;

pledge::schema::transaction_t make_authorization_transaction(
    const pledge::schema::account_id_t& account_id,
    const pledge::schema::account_id_t& contract_id,
    const pledge::schema::ed25519_public_key_t& public_key,
    const pledge::schema::amount_t& allowance) {
  auto permission = pledge::schema::function_call_permission_t{
      .allowance = allowance,
      .receiver_id = contract_id,
      .method_names = {std::string{pledge::schema::kProcessPaymentMethod}}};
  return pledge::schema::transaction_t{
      .signer_id = account_id,
      .public_key = std::nullopt,
      .nonce = 0,
      .receiver_id = account_id,
      .actions = {pledge::schema::add_key_action_t{
          .public_key = public_key,
          .access_key = pledge::schema::access_key_t{
              .nonce = 0, .permission = std::move(permission)}}}};
}

scoped_key_issuer::scoped_key_issuer(pledge::schema::amount_t default_allowance)
    : default_allowance_{std::move(default_allowance)} {}

pledge::schema::value_result<issued_key> scoped_key_issuer::issue(
    const pledge::schema::account_id_t& account_id,
    const pledge::schema::subscription_id_t& subscription_id,
    const pledge::schema::account_id_t& contract_id,
    const std::optional<pledge::schema::amount_t>& allowance) const {
  if (account_id.empty() || subscription_id.empty() || contract_id.empty()) {
    return pledge::schema::make_value_error<issued_key>(
        error_code::invalid_parameters,
        "account, subscription and contract ids are required",
        std::string{kIssuerCodespace});
  }
  auto cap = allowance.value_or(default_allowance_);
  if (cap == 0) {
    return pledge::schema::make_value_error<issued_key>(
        error_code::invalid_parameters, "allowance must be positive",
        std::string{kIssuerCodespace});
  }

  auto key = pledge::crypto::secret_key::generate();
  if (!key) {
    spdlog::error("Key generation failed for subscription {}", subscription_id);
    return pledge::schema::make_value_error<issued_key>(
        error_code::enclave_unavailable, "key generation failed",
        std::string{kIssuerCodespace});
  }

  auto transaction = make_authorization_transaction(account_id, contract_id,
                                                    key->public_key(), cap);
  spdlog::info("Issued scoped key {} for subscription {} on {}",
               pledge::crypto::to_string(key->public_key()), subscription_id,
               contract_id);
  return pledge::schema::make_value(
      issued_key{.transaction = std::move(transaction), .key = std::move(*key)});
}

}  // namespace pledge::issuer
