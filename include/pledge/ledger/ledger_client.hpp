#pragma once

#include <pledge/schema/enum_string.hpp>
#include <pledge/schema/merchant.hpp>
#include <pledge/schema/operation_result.hpp>
#include <pledge/schema/subscription_state.hpp>
#include <pledge/schema/transaction.hpp>

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace pledge::ledger {

inline constexpr auto kLedgerCodespace = std::string_view{"pledge.ledger"};

enum class submission_status_t : uint8_t {
  confirmed = 0,
  rejected = 1,
  timeout = 2
};

inline constexpr auto kSubmissionStatusMappings =
    std::array{std::pair<std::string_view, submission_status_t>{
                   "confirmed", submission_status_t::confirmed},
               std::pair<std::string_view, submission_status_t>{
                   "rejected", submission_status_t::rejected},
               std::pair<std::string_view, submission_status_t>{
                   "timeout", submission_status_t::timeout}};

inline constexpr std::string_view to_string(const submission_status_t value) {
  return pledge::schema::to_string(value, kSubmissionStatusMappings)
      .value_or("unknown");
}

struct submission_result final {
  submission_status_t status{submission_status_t::rejected};
  std::optional<pledge::schema::hash32_t> transaction_hash;
  std::string message;
};

/// Remote ledger hosting the subscription contract.
///
/// Implementations must honour the timeout passed to `submit`: a call that
/// cannot complete in time reports `timeout` and leaves the outcome unknown
/// to the caller.
class ledger_client {
 public:
  virtual ~ledger_client() = default;

  virtual submission_result submit(
      const pledge::schema::signed_transaction_t& transaction,
      std::chrono::milliseconds timeout) = 0;

  /// Current nonce of an access key, or std::nullopt when the key is
  /// unknown or the ledger is unreachable.
  virtual std::optional<uint64_t> access_key_nonce(
      const pledge::schema::account_id_t& account_id,
      const pledge::schema::ed25519_public_key_t& public_key) = 0;

  /// Bind a scoped key to a subscription in the contract. Fails unless the
  /// key is already installed on the payer account with a function-call
  /// permission for this contract.
  virtual pledge::schema::operation_result_t register_subscription_key(
      const pledge::schema::subscription_state_t& subscription,
      const pledge::schema::ed25519_public_key_t& public_key) = 0;

  /// registration_failed when the contract rejects the attestation,
  /// ledger_rejected when the ledger could not be reached.
  virtual pledge::schema::operation_result_t register_worker(
      const pledge::schema::account_id_t& account_id,
      const pledge::schema::bytes_t& quote,
      const pledge::schema::hash32_t& measurement) = 0;

  /// std::nullopt when the ledger could not be queried.
  virtual std::optional<bool> is_worker_verified(
      const pledge::schema::account_id_t& account_id) = 0;

  virtual pledge::schema::value_result<std::vector<pledge::schema::merchant_t>>
  list_merchants() = 0;
};

}  // namespace pledge::ledger
