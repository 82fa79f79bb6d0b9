#include <spdlog/spdlog.h>
#include <pledge/blake3/hash.hpp>
#include <pledge/schema/key/keys.hpp>
#include <pledge/subscription/store.hpp>

#include <algorithm>
#include <limits>
#include <tuple>

namespace pledge::subscription {

namespace {

using pledge::schema::error_code;
using pledge::schema::subscription_state_t;
using pledge::schema::subscription_status_t;

constexpr auto kIdPrefix = std::string_view{"sub-"};
constexpr auto kIdHexLength = size_t{24};

pledge::schema::value_result<subscription_state_t> store_error(
    const error_code code,
    std::string log) {
  return pledge::schema::make_value_error<subscription_state_t>(
      code, std::move(log), std::string{kStoreCodespace});
}

pledge::schema::value_result<subscription_state_t> invalid_transition(
    const subscription_state_t& state,
    const std::string_view operation) {
  spdlog::warn("Rejected {} on subscription {} in state {}", operation,
               state.id, pledge::schema::to_string(state.status));
  return store_error(error_code::invalid_state,
                     "cannot " + std::string{operation} + " a " +
                         std::string{pledge::schema::to_string(state.status)} +
                         " subscription");
}

pledge::schema::timestamp_milliseconds_t add_seconds(
    const pledge::schema::timestamp_milliseconds_t timestamp,
    const uint64_t seconds) {
  constexpr auto kMax =
      std::numeric_limits<pledge::schema::timestamp_milliseconds_t>::max();
  if (seconds > (kMax - timestamp) / 1000) {
    return kMax;
  }
  return timestamp + seconds * 1000;
}

}  // namespace

pledge::schema::duration_milliseconds_t retry_delay(const retry_policy& policy,
                                                    const uint32_t failures) {
  if (failures == 0) {
    return 0;
  }
  auto delay = policy.base_delay_ms;
  for (auto i = uint32_t{1}; i < failures && delay < policy.max_delay_ms; ++i) {
    delay *= 2;
  }
  return std::min(delay, policy.max_delay_ms);
}

subscription_store::subscription_store(
    pledge::storage::rocksdb_storage_t& storage,
    pledge::common::clock_t clock,
    retry_policy policy)
    : storage_{storage}, clock_{std::move(clock)}, policy_{policy} {}

void subscription_store::set_key_retirement_handler(
    key_retirement_handler_t handler) {
  auto lock = std::scoped_lock{mutex_};
  key_retirement_handler_ = std::move(handler);
}

std::optional<subscription_state_t> subscription_store::load(
    const pledge::schema::subscription_id_t& id) {
  return storage_.get<subscription_state_t>(
      encoder_, pledge::schema::key::make_subscription_key(encoder_, id));
}

void subscription_store::save(const subscription_state_t& state) {
  storage_.put(encoder_,
               pledge::schema::key::make_subscription_key(encoder_, state.id),
               state);
}

void subscription_store::retire_key(
    const pledge::schema::subscription_id_t& id) {
  auto handler = key_retirement_handler_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    handler = key_retirement_handler_;
  }
  if (handler) {
    handler(id);
  }
}

pledge::schema::value_result<subscription_state_t> subscription_store::create(
    const create_request& request) {
  if (request.merchant_id.empty()) {
    return store_error(error_code::invalid_parameters,
                       "merchant id is required");
  }
  if (request.payer_account_id.empty()) {
    return store_error(error_code::invalid_parameters,
                       "payer account id is required");
  }
  if (request.amount == 0) {
    return store_error(error_code::invalid_parameters,
                       "amount must be positive");
  }
  if (request.frequency_seconds <= 0) {
    return store_error(error_code::invalid_parameters,
                       "frequency must be positive");
  }
  if (request.frequency_seconds > kMaxFrequencySeconds) {
    return store_error(error_code::invalid_parameters,
                       "frequency must not exceed 100 years");
  }
  if (request.max_payments &&
      (*request.max_payments <= 0 ||
       *request.max_payments > std::numeric_limits<uint32_t>::max())) {
    return store_error(error_code::invalid_parameters,
                       "max payments must be a positive 32-bit count");
  }
  if (request.token_address && request.token_address->empty()) {
    return store_error(error_code::invalid_parameters,
                       "token address must not be empty when given");
  }

  auto lock = std::scoped_lock{mutex_};
  auto sequence_key = pledge::schema::key::make_prefix_key(
      encoder_, pledge::schema::key::kSubscriptionSequenceKey);
  auto sequence =
      storage_.get<uint64_t>(encoder_, sequence_key).value_or(0) + 1;
  auto now = clock_();

  auto digest = pledge::blake3::hash(encoder_.encode(
      std::tuple{request.merchant_id, request.payer_account_id, sequence, now}));
  auto id = std::string{kIdPrefix} +
            pledge::schema::to_hex(digest).substr(0, kIdHexLength);
  if (load(id)) {
    return store_error(error_code::already_exists,
                       "subscription id already exists");
  }

  auto state = subscription_state_t{
      .id = id,
      .merchant_id = request.merchant_id,
      .payer_account_id = request.payer_account_id,
      .amount = request.amount,
      .frequency_seconds = static_cast<uint64_t>(request.frequency_seconds),
      .max_payments =
          request.max_payments
              ? std::optional<uint32_t>{static_cast<uint32_t>(
                    *request.max_payments)}
              : std::nullopt,
      .status = subscription_status_t::pending,
      .token_address = request.token_address,
      .created_at = now,
      .sequence = sequence};

  storage_.apply(
      {pledge::storage::batch_operation{
           .key = pledge::schema::key::make_subscription_key(encoder_, id),
           .value = encoder_.encode(state)},
       pledge::storage::batch_operation{
           .key = pledge::schema::key::make_payer_index_key(
               encoder_, request.payer_account_id, sequence),
           .value = encoder_.encode(id)},
       pledge::storage::batch_operation{.key = sequence_key,
                                        .value = encoder_.encode(sequence)}});

  spdlog::info("Created subscription {} merchant={} payer={} amount={}", id,
               state.merchant_id, state.payer_account_id,
               pledge::schema::to_string(state.amount));
  return pledge::schema::make_value(std::move(state));
}

pledge::schema::value_result<subscription_state_t>
subscription_store::authorize(
    const pledge::schema::subscription_id_t& id,
    const pledge::schema::ed25519_public_key_t& public_key) {
  auto lock = std::scoped_lock{mutex_};
  auto state = load(id);
  if (!state) {
    return store_error(error_code::not_found, "subscription not found");
  }
  if (state->status != subscription_status_t::pending) {
    return invalid_transition(*state, "authorize");
  }
  state->authorized_public_key = public_key;
  state->status = subscription_status_t::active;
  state->next_charge_at = clock_();
  save(*state);
  spdlog::info("Subscription {} authorized and active", id);
  return pledge::schema::make_value(std::move(*state));
}

pledge::schema::value_result<subscription_state_t> subscription_store::get(
    const pledge::schema::subscription_id_t& id) {
  auto lock = std::scoped_lock{mutex_};
  auto state = load(id);
  if (!state) {
    return store_error(error_code::not_found, "subscription not found");
  }
  return pledge::schema::make_value(std::move(*state));
}

std::vector<subscription_state_t> subscription_store::list(
    const pledge::schema::account_id_t& account_id) {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<subscription_state_t>{};
  auto entries = storage_.list_by_prefix(
      pledge::schema::key::make_payer_index_prefix(encoder_, account_id));
  for (const auto& [key, value] : entries) {
    auto id = encoder_.decode<pledge::schema::subscription_id_t>(value);
    auto state = load(id);
    if (!state) {
      spdlog::error("Payer index for {} references missing subscription {}",
                    account_id, id);
      continue;
    }
    out.push_back(std::move(*state));
  }
  return out;
}

std::vector<subscription_state_t> subscription_store::due(
    const pledge::schema::timestamp_milliseconds_t now) {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<subscription_state_t>{};
  auto entries =
      storage_.list_by_prefix(pledge::schema::key::make_prefix_key(
          encoder_, pledge::schema::key::kSubscriptionKeyPrefix));
  for (const auto& [key, value] : entries) {
    auto state = encoder_.decode<subscription_state_t>(value);
    if (state.status == subscription_status_t::active &&
        state.next_charge_at && *state.next_charge_at <= now) {
      out.push_back(std::move(state));
    }
  }
  std::ranges::sort(out, [](const auto& lhs, const auto& rhs) {
    return std::tie(*lhs.next_charge_at, lhs.sequence) <
           std::tie(*rhs.next_charge_at, rhs.sequence);
  });
  return out;
}

pledge::schema::value_result<subscription_state_t> subscription_store::pause(
    const pledge::schema::subscription_id_t& id) {
  auto lock = std::scoped_lock{mutex_};
  auto state = load(id);
  if (!state) {
    return store_error(error_code::not_found, "subscription not found");
  }
  if (state->status != subscription_status_t::active) {
    return invalid_transition(*state, "pause");
  }
  state->status = subscription_status_t::paused;
  state->next_charge_at = std::nullopt;
  save(*state);
  spdlog::info("Subscription {} paused", id);
  return pledge::schema::make_value(std::move(*state));
}

pledge::schema::value_result<subscription_state_t> subscription_store::resume(
    const pledge::schema::subscription_id_t& id) {
  auto lock = std::scoped_lock{mutex_};
  auto state = load(id);
  if (!state) {
    return store_error(error_code::not_found, "subscription not found");
  }
  if (state->status != subscription_status_t::paused) {
    return invalid_transition(*state, "resume");
  }
  auto now = clock_();
  state->status = subscription_status_t::active;
  state->next_charge_at = now;
  if (state->last_charged_at) {
    // The period already paid for is not charged again.
    state->next_charge_at = std::max(
        now, add_seconds(*state->last_charged_at, state->frequency_seconds));
  }
  state->consecutive_failures = 0;
  state->needs_review = false;
  state->last_failure = std::nullopt;
  save(*state);
  spdlog::info("Subscription {} resumed", id);
  return pledge::schema::make_value(std::move(*state));
}

pledge::schema::value_result<subscription_state_t> subscription_store::cancel(
    const pledge::schema::subscription_id_t& id) {
  auto state = std::optional<subscription_state_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    state = load(id);
    if (!state) {
      return store_error(error_code::not_found, "subscription not found");
    }
    if (state->status == subscription_status_t::cancelled) {
      return pledge::schema::make_value(std::move(*state));
    }
    if (state->status == subscription_status_t::completed) {
      return invalid_transition(*state, "cancel");
    }
    state->status = subscription_status_t::cancelled;
    state->next_charge_at = std::nullopt;
    save(*state);
  }
  spdlog::info("Subscription {} cancelled", id);
  retire_key(id);
  return pledge::schema::make_value(std::move(*state));
}

pledge::schema::value_result<subscription_state_t>
subscription_store::record_charge(const pledge::schema::subscription_id_t& id,
                                  const charge_outcome& outcome) {
  auto state = std::optional<subscription_state_t>{};
  auto completed = false;
  {
    auto lock = std::scoped_lock{mutex_};
    state = load(id);
    if (!state) {
      return store_error(error_code::not_found, "subscription not found");
    }
    if (state->status == subscription_status_t::pending) {
      return invalid_transition(*state, "charge");
    }
    // A charge already submitted to the ledger is recorded whatever
    // lifecycle change landed while it was in flight.
    auto was_active = state->status == subscription_status_t::active;
    if (!was_active) {
      spdlog::warn("Recording in-flight charge for {} subscription {}",
                   pledge::schema::to_string(state->status), id);
    }

    state->charge_attempts += 1;
    auto record = pledge::schema::charge_record_t{
        .subscription_id = id,
        .attempt = state->charge_attempts,
        .attempted_at = outcome.timestamp,
        .success = outcome.success,
        .amount = state->amount,
        .transaction_hash = outcome.transaction_hash,
        .message = outcome.message};

    if (outcome.success) {
      state->payments_made += 1;
      state->last_charged_at = outcome.timestamp;
      state->consecutive_failures = 0;
      state->last_failure = std::nullopt;
      auto capped = state->max_payments &&
                    state->payments_made >= *state->max_payments;
      if (capped && state->status != subscription_status_t::cancelled &&
          state->status != subscription_status_t::completed) {
        state->status = subscription_status_t::completed;
        state->next_charge_at = std::nullopt;
        completed = true;
      } else if (was_active) {
        state->next_charge_at =
            add_seconds(outcome.timestamp, state->frequency_seconds);
      }
    } else if (was_active) {
      state->consecutive_failures += 1;
      state->last_failure = outcome.message;
      if (state->consecutive_failures >= policy_.max_consecutive_failures) {
        state->status = subscription_status_t::paused;
        state->next_charge_at = std::nullopt;
        state->needs_review = true;
        spdlog::warn(
            "Subscription {} paused for review after {} consecutive failures",
            id, state->consecutive_failures);
      } else {
        state->next_charge_at =
            outcome.timestamp +
            retry_delay(policy_, state->consecutive_failures);
      }
    }

    storage_.apply(
        {pledge::storage::batch_operation{
             .key = pledge::schema::key::make_subscription_key(encoder_, id),
             .value = encoder_.encode(*state)},
         pledge::storage::batch_operation{
             .key = pledge::schema::key::make_charge_history_key(
                 encoder_, id, record.attempt),
             .value = encoder_.encode(record)}});
  }

  if (outcome.success) {
    spdlog::info("Charged subscription {} ({} of {})", id,
                 state->payments_made,
                 state->max_payments ? std::to_string(*state->max_payments)
                                     : std::string{"unlimited"});
  } else {
    spdlog::warn("Charge failed for subscription {}: {}", id, outcome.message);
  }
  if (completed) {
    spdlog::info("Subscription {} completed", id);
    retire_key(id);
  }
  return pledge::schema::make_value(std::move(*state));
}

std::vector<pledge::schema::charge_record_t> subscription_store::history(
    const pledge::schema::subscription_id_t& id) {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<pledge::schema::charge_record_t>{};
  auto entries = storage_.list_by_prefix(
      pledge::schema::key::make_charge_history_prefix(encoder_, id));
  out.reserve(entries.size());
  for (const auto& [key, value] : entries) {
    out.push_back(encoder_.decode<pledge::schema::charge_record_t>(value));
  }
  return out;
}

}  // namespace pledge::subscription
