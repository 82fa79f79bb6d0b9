#pragma once

#include <pledge/common/clock.hpp>
#include <pledge/schema/charge_record.hpp>
#include <pledge/schema/encoding/scale/encoder.hpp>
#include <pledge/schema/operation_result.hpp>
#include <pledge/schema/subscription_state.hpp>
#include <pledge/storage/rocksdb/storage.hpp>

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pledge::subscription {

inline constexpr auto kStoreCodespace = std::string_view{"pledge.store"};

/// Longest accepted billing period: one hundred 365-day years.
inline constexpr auto kMaxFrequencySeconds = int64_t{100} * 365 * 86400;

/// Rescheduling of failed charges: capped exponential backoff, then a
/// force-pause for operator review.
struct retry_policy final {
  pledge::schema::duration_milliseconds_t base_delay_ms{60000};
  pledge::schema::duration_milliseconds_t max_delay_ms{3600000};
  uint32_t max_consecutive_failures{5};
};

/// min(base * 2^(failures - 1), cap); zero failures yields zero.
pledge::schema::duration_milliseconds_t retry_delay(const retry_policy& policy,
                                                    uint32_t failures);

struct create_request final {
  pledge::schema::merchant_id_t merchant_id;
  pledge::schema::account_id_t payer_account_id;
  pledge::schema::amount_t amount{};
  int64_t frequency_seconds{};
  std::optional<int64_t> max_payments;
  std::optional<std::string> token_address;
};

struct charge_outcome final {
  bool success{false};
  pledge::schema::timestamp_milliseconds_t timestamp{};
  std::string message;
  std::optional<pledge::schema::hash32_t> transaction_hash;
};

/// Durable subscription state machine.
///
///   pending --authorize--> active <--pause/resume--> paused
///   pending|active|paused --cancel--> cancelled
///   active --record_charge(cap reached)--> completed
///
/// All mutations are serialized by one mutex and persisted before return.
class subscription_store final {
 public:
  using key_retirement_handler_t =
      std::function<void(const pledge::schema::subscription_id_t&)>;

  subscription_store(pledge::storage::rocksdb_storage_t& storage,
                     pledge::common::clock_t clock,
                     retry_policy policy = {});

  pledge::schema::value_result<pledge::schema::subscription_state_t> create(
      const create_request& request);

  /// pending -> active once the scoped key has been accepted by the ledger.
  pledge::schema::value_result<pledge::schema::subscription_state_t> authorize(
      const pledge::schema::subscription_id_t& id,
      const pledge::schema::ed25519_public_key_t& public_key);

  pledge::schema::value_result<pledge::schema::subscription_state_t> get(
      const pledge::schema::subscription_id_t& id);

  /// Subscriptions paid by `account_id`, in creation order.
  std::vector<pledge::schema::subscription_state_t> list(
      const pledge::schema::account_id_t& account_id);

  /// Active subscriptions with next_charge_at <= now, earliest first.
  std::vector<pledge::schema::subscription_state_t> due(
      pledge::schema::timestamp_milliseconds_t now);

  pledge::schema::value_result<pledge::schema::subscription_state_t> pause(
      const pledge::schema::subscription_id_t& id);
  pledge::schema::value_result<pledge::schema::subscription_state_t> resume(
      const pledge::schema::subscription_id_t& id);
  /// Idempotent on an already cancelled subscription; the key retirement
  /// handler runs only on the first cancel.
  pledge::schema::value_result<pledge::schema::subscription_state_t> cancel(
      const pledge::schema::subscription_id_t& id);

  pledge::schema::value_result<pledge::schema::subscription_state_t>
  record_charge(const pledge::schema::subscription_id_t& id,
                const charge_outcome& outcome);

  std::vector<pledge::schema::charge_record_t> history(
      const pledge::schema::subscription_id_t& id);

  /// Called after a subscription reaches cancelled or completed.
  void set_key_retirement_handler(key_retirement_handler_t handler);

  const retry_policy& policy() const { return policy_; }

 private:
  std::optional<pledge::schema::subscription_state_t> load(
      const pledge::schema::subscription_id_t& id);
  void save(const pledge::schema::subscription_state_t& state);
  void retire_key(const pledge::schema::subscription_id_t& id);

  pledge::storage::rocksdb_storage_t& storage_;
  pledge::common::clock_t clock_;
  retry_policy policy_;
  pledge::schema::encoding::scale_encoder_t encoder_;
  key_retirement_handler_t key_retirement_handler_;
  std::mutex mutex_;
};

}  // namespace pledge::subscription
