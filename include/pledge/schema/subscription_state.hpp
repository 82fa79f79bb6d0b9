#pragma once
#include <pledge/schema/primitives.hpp>
#include <pledge/schema/subscription_status.hpp>
#include <optional>
#include <string>

namespace pledge::schema {

template <uint16_t Version>
struct subscription_state;

/// Durable subscription record.
///
/// `next_charge_at` is set only while `status == active`.
/// `authorized_public_key` is set once the scoped key is accepted by the
/// ledger and never changes afterwards.
template <>
struct subscription_state<1> final {
  uint16_t version{1};
  subscription_id_t id;
  merchant_id_t merchant_id;
  account_id_t payer_account_id;
  amount_t amount{};
  uint64_t frequency_seconds{};
  std::optional<uint32_t> max_payments;
  uint32_t payments_made{};
  subscription_status_t status{subscription_status_t::pending};
  std::optional<timestamp_milliseconds_t> next_charge_at;
  std::optional<std::string> token_address;
  std::optional<ed25519_public_key_t> authorized_public_key;
  timestamp_milliseconds_t created_at{};
  std::optional<timestamp_milliseconds_t> last_charged_at;
  uint32_t charge_attempts{};
  uint32_t consecutive_failures{};
  bool needs_review{false};
  std::optional<std::string> last_failure;
  uint64_t sequence{};
};

using subscription_state_t = subscription_state<1>;

}  // namespace pledge::schema
