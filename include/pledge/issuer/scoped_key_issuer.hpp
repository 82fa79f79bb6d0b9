#pragma once

#include <pledge/crypto/ed25519.hpp>
#include <pledge/schema/operation_result.hpp>
#include <pledge/schema/transaction.hpp>

#include <optional>
#include <string_view>

namespace pledge::issuer {

inline constexpr auto kIssuerCodespace = std::string_view{"pledge.issuer"};

/// 0.25 of the native token in yocto units: enough gas reserve for a long
/// run of `process_payment` calls, nothing toward principal.
inline constexpr auto kDefaultAllowance =
    std::string_view{"250000000000000000000000"};

/// Fresh scoped keypair and the unsigned transaction that authorizes it.
struct issued_key final {
  pledge::schema::transaction_t transaction;
  pledge::crypto::secret_key key;
};

class scoped_key_issuer final {
 public:
  explicit scoped_key_issuer(pledge::schema::amount_t default_allowance);

  /// Generate a new keypair and build the add-key transaction for
  /// `account_id` granting it function-call access to `process_payment` on
  /// `contract_id`, capped at `allowance` (or the default). The transaction
  /// carries no signer key or nonce; the user's wallet fills those in.
  pledge::schema::value_result<issued_key> issue(
      const pledge::schema::account_id_t& account_id,
      const pledge::schema::subscription_id_t& subscription_id,
      const pledge::schema::account_id_t& contract_id,
      const std::optional<pledge::schema::amount_t>& allowance) const;

  const pledge::schema::amount_t& default_allowance() const {
    return default_allowance_;
  }

 private:
  pledge::schema::amount_t default_allowance_;
};

/// The add-key transaction for an existing public key.
pledge::schema::transaction_t make_authorization_transaction(
    const pledge::schema::account_id_t& account_id,
    const pledge::schema::account_id_t& contract_id,
    const pledge::schema::ed25519_public_key_t& public_key,
    const pledge::schema::amount_t& allowance);

}  // namespace pledge::issuer
