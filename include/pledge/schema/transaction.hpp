#pragma once
#include <pledge/schema/access_key_permission.hpp>
#include <pledge/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pledge::schema {

template <uint16_t Version>
struct add_key_action;

template <>
struct add_key_action<1> final {
  uint16_t version{1};
  ed25519_public_key_t public_key{};
  access_key_t access_key;
};

using add_key_action_t = add_key_action<1>;

template <uint16_t Version>
struct function_call_action;

template <>
struct function_call_action<1> final {
  uint16_t version{1};
  std::string method_name;
  bytes_t args;
  uint64_t gas{};
  amount_t deposit{};
};

using function_call_action_t = function_call_action<1>;

using action_t = std::variant<add_key_action_t, function_call_action_t>;

template <uint16_t Version>
struct transaction;

/// Ledger transaction. `public_key` is empty on authorization transactions
/// handed to a wallet, which fills in its own full-access key when signing.
template <>
struct transaction<1> final {
  uint16_t version{1};
  account_id_t signer_id;
  std::optional<ed25519_public_key_t> public_key;
  uint64_t nonce{};
  account_id_t receiver_id;
  std::vector<action_t> actions;
};

using transaction_t = transaction<1>;

template <uint16_t Version>
struct signed_transaction;

template <>
struct signed_transaction<1> final {
  uint16_t version{1};
  transaction_t transaction;
  ed25519_signature_t signature{};
};

using signed_transaction_t = signed_transaction<1>;

/// Arguments of the contract's `process_payment` entry point.
template <uint16_t Version>
struct process_payment_args;

template <>
struct process_payment_args<1> final {
  uint16_t version{1};
  subscription_id_t subscription_id;
  amount_t amount{};
  std::optional<std::string> token_address;
};

using process_payment_args_t = process_payment_args<1>;

inline constexpr auto kProcessPaymentMethod = std::string_view{"process_payment"};

}  // namespace pledge::schema
