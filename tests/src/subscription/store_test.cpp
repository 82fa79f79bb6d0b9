#include <gtest/gtest.h>
#include <pledge/storage/rocksdb/storage.hpp>
#include <pledge/subscription/store.hpp>
#include <pledge/testing/common.hpp>

#include <string>
#include <vector>

namespace {

using pledge::schema::error_code;
using pledge::schema::subscription_status_t;

struct store_fixture final {
  explicit store_fixture(const std::string_view name,
                         pledge::subscription::retry_policy policy = {})
      : directory{name},
        storage{
            pledge::storage::make_storage<pledge::storage::rocksdb_storage_tag>(
                directory.path + "/state")},
        store{storage, clock.clock(), policy} {
    store.set_key_retirement_handler(
        [this](const pledge::schema::subscription_id_t& id) {
          retired.push_back(id);
        });
  }

  pledge::subscription::create_request make_request(
      const std::string& payer = "alice.test") {
    return pledge::subscription::create_request{
        .merchant_id = "m1",
        .payer_account_id = payer,
        .amount = 1000,
        .frequency_seconds = 86400,
        .max_payments = std::nullopt,
        .token_address = std::nullopt};
  }

  pledge::schema::subscription_state_t create_active(
      pledge::subscription::create_request request) {
    auto created = store.create(request);
    EXPECT_TRUE(created.ok()) << created.result.log;
    auto authorized =
        store.authorize(created.value->id, pledge::testing::make_hash(1));
    EXPECT_TRUE(authorized.ok()) << authorized.result.log;
    return *authorized.value;
  }

  pledge::subscription::charge_outcome success() {
    return pledge::subscription::charge_outcome{
        .success = true,
        .timestamp = clock.now.load(),
        .message = "confirmed",
        .transaction_hash = pledge::testing::make_hash(2)};
  }

  pledge::subscription::charge_outcome failure(
      const std::string& message = "insufficient balance") {
    return pledge::subscription::charge_outcome{
        .success = false, .timestamp = clock.now.load(), .message = message};
  }

  pledge::testing::temp_directory directory;
  pledge::testing::manual_clock clock;
  pledge::storage::rocksdb_storage_t storage;
  pledge::subscription::subscription_store store;
  std::vector<pledge::schema::subscription_id_t> retired;
};

}  // namespace

TEST(subscription_store, create_validates_request) {
  auto fixture = store_fixture{"pledge_store_validate"};

  auto request = fixture.make_request();
  request.amount = 0;
  EXPECT_EQ(fixture.store.create(request).result.code,
            error_code::invalid_parameters);

  request = fixture.make_request();
  request.frequency_seconds = 0;
  EXPECT_EQ(fixture.store.create(request).result.code,
            error_code::invalid_parameters);
  request.frequency_seconds = -60;
  EXPECT_EQ(fixture.store.create(request).result.code,
            error_code::invalid_parameters);

  request = fixture.make_request();
  request.max_payments = 0;
  EXPECT_EQ(fixture.store.create(request).result.code,
            error_code::invalid_parameters);
  request.max_payments = -1;
  EXPECT_EQ(fixture.store.create(request).result.code,
            error_code::invalid_parameters);

  request = fixture.make_request();
  request.merchant_id.clear();
  EXPECT_EQ(fixture.store.create(request).result.code,
            error_code::invalid_parameters);

  request = fixture.make_request("");
  EXPECT_EQ(fixture.store.create(request).result.code,
            error_code::invalid_parameters);

  request = fixture.make_request();
  request.token_address = std::string{};
  EXPECT_EQ(fixture.store.create(request).result.code,
            error_code::invalid_parameters);

  EXPECT_TRUE(fixture.store.list("alice.test").empty());
}

TEST(subscription_store, create_starts_pending_with_unique_ids) {
  auto fixture = store_fixture{"pledge_store_create"};
  auto first = fixture.store.create(fixture.make_request());
  auto second = fixture.store.create(fixture.make_request());
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());

  EXPECT_EQ(first.value->status, subscription_status_t::pending);
  EXPECT_FALSE(first.value->next_charge_at.has_value());
  EXPECT_FALSE(first.value->authorized_public_key.has_value());
  EXPECT_EQ(first.value->payments_made, 0u);
  EXPECT_EQ(first.value->created_at, fixture.clock.now.load());
  EXPECT_EQ(first.value->id.rfind("sub-", 0), 0u);
  EXPECT_EQ(first.value->id.size(), 4u + 24u);
  EXPECT_NE(first.value->id, second.value->id);
  EXPECT_LT(first.value->sequence, second.value->sequence);

  // Pending subscriptions are never due.
  EXPECT_TRUE(fixture.store.due(fixture.clock.now.load() + 1000000).empty());
}

TEST(subscription_store, authorize_activates_pending_only) {
  auto fixture = store_fixture{"pledge_store_authorize"};
  auto created = fixture.store.create(fixture.make_request());
  ASSERT_TRUE(created.ok());
  const auto& id = created.value->id;

  auto authorized = fixture.store.authorize(id, pledge::testing::make_hash(1));
  ASSERT_TRUE(authorized.ok());
  EXPECT_EQ(authorized.value->status, subscription_status_t::active);
  EXPECT_EQ(authorized.value->next_charge_at, fixture.clock.now.load());
  EXPECT_EQ(authorized.value->authorized_public_key,
            pledge::testing::make_hash(1));

  auto again = fixture.store.authorize(id, pledge::testing::make_hash(2));
  EXPECT_EQ(again.result.code, error_code::invalid_state);
  EXPECT_EQ(fixture.store.get(id).value->authorized_public_key,
            pledge::testing::make_hash(1));

  EXPECT_EQ(fixture.store
                .authorize("sub-missing", pledge::testing::make_hash(1))
                .result.code,
            error_code::not_found);
}

TEST(subscription_store, list_returns_payer_subscriptions_in_creation_order) {
  auto fixture = store_fixture{"pledge_store_list"};
  auto ids = std::vector<std::string>{};
  for (auto i = 0; i < 3; ++i) {
    auto created = fixture.store.create(fixture.make_request());
    ASSERT_TRUE(created.ok());
    ids.push_back(created.value->id);
    fixture.clock.advance(1);
  }
  ASSERT_TRUE(fixture.store.create(fixture.make_request("bob.test")).ok());

  auto listed = fixture.store.list("alice.test");
  ASSERT_EQ(listed.size(), 3u);
  for (size_t i = 0; i < ids.size(); ++i) {
    EXPECT_EQ(listed[i].id, ids[i]);
  }
  EXPECT_EQ(fixture.store.list("bob.test").size(), 1u);
  EXPECT_TRUE(fixture.store.list("carol.test").empty());
}

TEST(subscription_store, due_orders_by_next_charge_then_creation) {
  auto fixture = store_fixture{"pledge_store_due"};
  auto first = fixture.create_active(fixture.make_request());
  auto second = fixture.create_active(fixture.make_request());
  fixture.clock.advance(10);
  auto third = fixture.create_active(fixture.make_request());

  // Push the first one out a full period.
  ASSERT_TRUE(fixture.store.record_charge(first.id, fixture.success()).ok());

  auto due = fixture.store.due(fixture.clock.now.load());
  ASSERT_EQ(due.size(), 2u);
  EXPECT_EQ(due[0].id, second.id);
  EXPECT_EQ(due[1].id, third.id);

  EXPECT_EQ(fixture.store.due(fixture.clock.now.load() - 10).size(), 1u);
}

TEST(subscription_store, pause_resume_round_trip_restores_activity) {
  auto fixture = store_fixture{"pledge_store_pause"};
  auto state = fixture.create_active(fixture.make_request());
  ASSERT_TRUE(fixture.store.record_charge(state.id, fixture.failure()).ok());

  auto paused = fixture.store.pause(state.id);
  ASSERT_TRUE(paused.ok());
  EXPECT_EQ(paused.value->status, subscription_status_t::paused);
  EXPECT_FALSE(paused.value->next_charge_at.has_value());
  EXPECT_TRUE(fixture.store
                  .due(fixture.clock.now.load() +
                       pledge::testing::kDayMilliseconds)
                  .empty());

  EXPECT_EQ(fixture.store.pause(state.id).result.code,
            error_code::invalid_state);

  fixture.clock.advance(5000);
  auto resumed = fixture.store.resume(state.id);
  ASSERT_TRUE(resumed.ok());
  EXPECT_EQ(resumed.value->status, subscription_status_t::active);
  EXPECT_EQ(resumed.value->next_charge_at, fixture.clock.now.load());
  EXPECT_EQ(resumed.value->consecutive_failures, 0u);
  EXPECT_FALSE(resumed.value->last_failure.has_value());
  EXPECT_EQ(resumed.value->payments_made, state.payments_made);
  EXPECT_EQ(resumed.value->authorized_public_key, state.authorized_public_key);

  EXPECT_EQ(fixture.store.resume(state.id).result.code,
            error_code::invalid_state);
}

TEST(subscription_store, cancel_is_idempotent_and_retires_key_once) {
  auto fixture = store_fixture{"pledge_store_cancel"};
  auto state = fixture.create_active(fixture.make_request());

  auto cancelled = fixture.store.cancel(state.id);
  ASSERT_TRUE(cancelled.ok());
  EXPECT_EQ(cancelled.value->status, subscription_status_t::cancelled);
  EXPECT_FALSE(cancelled.value->next_charge_at.has_value());

  auto again = fixture.store.cancel(state.id);
  ASSERT_TRUE(again.ok());
  EXPECT_EQ(again.value->status, subscription_status_t::cancelled);

  ASSERT_EQ(fixture.retired.size(), 1u);
  EXPECT_EQ(fixture.retired.front(), state.id);

  EXPECT_EQ(fixture.store.pause(state.id).result.code,
            error_code::invalid_state);
  EXPECT_EQ(fixture.store.resume(state.id).result.code,
            error_code::invalid_state);
  EXPECT_TRUE(fixture.store.due(fixture.clock.now.load()).empty());

  EXPECT_EQ(fixture.store.cancel("sub-missing").result.code,
            error_code::not_found);
}

TEST(subscription_store, pending_subscription_can_be_cancelled) {
  auto fixture = store_fixture{"pledge_store_cancel_pending"};
  auto created = fixture.store.create(fixture.make_request());
  ASSERT_TRUE(created.ok());
  auto cancelled = fixture.store.cancel(created.value->id);
  ASSERT_TRUE(cancelled.ok());
  EXPECT_EQ(cancelled.value->status, subscription_status_t::cancelled);
  EXPECT_EQ(fixture.store.authorize(created.value->id,
                                    pledge::testing::make_hash(1))
                .result.code,
            error_code::invalid_state);
}

TEST(subscription_store, payments_stop_exactly_at_cap) {
  for (auto cap : {1, 2, 5}) {
    auto fixture = store_fixture{"pledge_store_cap"};
    auto request = fixture.make_request();
    request.max_payments = cap;
    auto state = fixture.create_active(request);

    for (auto i = 1; i <= cap; ++i) {
      auto charged = fixture.store.record_charge(state.id, fixture.success());
      ASSERT_TRUE(charged.ok());
      EXPECT_EQ(charged.value->payments_made, static_cast<uint32_t>(i));
      fixture.clock.advance(pledge::testing::kDayMilliseconds);
    }

    auto final_state = fixture.store.get(state.id);
    ASSERT_TRUE(final_state.ok());
    EXPECT_EQ(final_state.value->status, subscription_status_t::completed);
    EXPECT_EQ(final_state.value->payments_made, static_cast<uint32_t>(cap));
    EXPECT_FALSE(final_state.value->next_charge_at.has_value());
    EXPECT_EQ(fixture.store.record_charge(state.id, fixture.success())
                  .result.code,
              error_code::invalid_state);
    EXPECT_EQ(fixture.store.cancel(state.id).result.code,
              error_code::invalid_state);
    EXPECT_EQ(fixture.retired.size(), 1u);
    EXPECT_EQ(fixture.store.history(state.id).size(), static_cast<size_t>(cap));
  }
}

TEST(subscription_store, successful_charge_advances_by_frequency) {
  auto fixture = store_fixture{"pledge_store_advance"};
  auto state = fixture.create_active(fixture.make_request());
  auto charged = fixture.store.record_charge(state.id, fixture.success());
  ASSERT_TRUE(charged.ok());
  EXPECT_EQ(charged.value->next_charge_at,
            fixture.clock.now.load() + pledge::testing::kDayMilliseconds);
  EXPECT_EQ(charged.value->last_charged_at, fixture.clock.now.load());
  EXPECT_EQ(charged.value->charge_attempts, 1u);

  auto history = fixture.store.history(state.id);
  ASSERT_EQ(history.size(), 1u);
  EXPECT_TRUE(history[0].success);
  EXPECT_EQ(history[0].attempt, 1u);
  EXPECT_EQ(history[0].amount, 1000);
  EXPECT_EQ(history[0].transaction_hash, pledge::testing::make_hash(2));
}

TEST(subscription_store, retry_delay_doubles_up_to_cap) {
  auto policy = pledge::subscription::retry_policy{};
  EXPECT_EQ(pledge::subscription::retry_delay(policy, 0), 0u);
  EXPECT_EQ(pledge::subscription::retry_delay(policy, 1), 60000u);
  EXPECT_EQ(pledge::subscription::retry_delay(policy, 2), 120000u);
  EXPECT_EQ(pledge::subscription::retry_delay(policy, 3), 240000u);
  EXPECT_EQ(pledge::subscription::retry_delay(policy, 6), 1920000u);
  EXPECT_EQ(pledge::subscription::retry_delay(policy, 7), 3600000u);
  EXPECT_EQ(pledge::subscription::retry_delay(policy, 1000), 3600000u);
}

TEST(subscription_store, repeated_failures_back_off_then_pause_for_review) {
  auto fixture = store_fixture{"pledge_store_backoff"};
  auto state = fixture.create_active(fixture.make_request());
  const auto& policy = fixture.store.policy();

  for (auto failures = uint32_t{1}; failures < policy.max_consecutive_failures;
       ++failures) {
    auto failed = fixture.store.record_charge(state.id, fixture.failure());
    ASSERT_TRUE(failed.ok());
    EXPECT_EQ(failed.value->status, subscription_status_t::active);
    EXPECT_EQ(failed.value->consecutive_failures, failures);
    EXPECT_EQ(failed.value->next_charge_at,
              fixture.clock.now.load() +
                  pledge::subscription::retry_delay(policy, failures));
    EXPECT_EQ(failed.value->last_failure, "insufficient balance");
    fixture.clock.advance(*failed.value->next_charge_at -
                          fixture.clock.now.load());
  }

  auto paused = fixture.store.record_charge(state.id, fixture.failure());
  ASSERT_TRUE(paused.ok());
  EXPECT_EQ(paused.value->status, subscription_status_t::paused);
  EXPECT_TRUE(paused.value->needs_review);
  EXPECT_FALSE(paused.value->next_charge_at.has_value());
  EXPECT_EQ(paused.value->payments_made, 0u);
  EXPECT_EQ(fixture.store.history(state.id).size(),
            static_cast<size_t>(policy.max_consecutive_failures));

  auto resumed = fixture.store.resume(state.id);
  ASSERT_TRUE(resumed.ok());
  EXPECT_FALSE(resumed.value->needs_review);
  EXPECT_EQ(resumed.value->consecutive_failures, 0u);
}

TEST(subscription_store, success_clears_failure_streak) {
  auto fixture = store_fixture{"pledge_store_streak"};
  auto state = fixture.create_active(fixture.make_request());
  ASSERT_TRUE(fixture.store.record_charge(state.id, fixture.failure()).ok());
  ASSERT_TRUE(fixture.store.record_charge(state.id, fixture.failure()).ok());
  auto charged = fixture.store.record_charge(state.id, fixture.success());
  ASSERT_TRUE(charged.ok());
  EXPECT_EQ(charged.value->consecutive_failures, 0u);
  EXPECT_FALSE(charged.value->last_failure.has_value());
  EXPECT_EQ(charged.value->charge_attempts, 3u);
  EXPECT_EQ(charged.value->payments_made, 1u);
}

TEST(subscription_store, state_survives_reopen) {
  auto directory = pledge::testing::temp_directory{"pledge_store_reopen"};
  auto clock = pledge::testing::manual_clock{};
  auto id = std::string{};
  {
    auto storage =
        pledge::storage::make_storage<pledge::storage::rocksdb_storage_tag>(
            directory.path + "/state");
    auto store = pledge::subscription::subscription_store{storage, clock.clock()};
    auto created = store.create(pledge::subscription::create_request{
        .merchant_id = "m1",
        .payer_account_id = "alice.test",
        .amount = 1000,
        .frequency_seconds = 60});
    ASSERT_TRUE(created.ok());
    id = created.value->id;
    ASSERT_TRUE(store.authorize(id, pledge::testing::make_hash(1)).ok());
  }

  auto storage =
      pledge::storage::make_storage<pledge::storage::rocksdb_storage_tag>(
          directory.path + "/state");
  auto store = pledge::subscription::subscription_store{storage, clock.clock()};
  auto loaded = store.get(id);
  ASSERT_TRUE(loaded.ok());
  EXPECT_EQ(loaded.value->status, subscription_status_t::active);
  EXPECT_EQ(store.list("alice.test").size(), 1u);
  EXPECT_EQ(store.due(clock.now.load()).size(), 1u);

  auto next = store.create(pledge::subscription::create_request{
      .merchant_id = "m1",
      .payer_account_id = "alice.test",
      .amount = 1000,
      .frequency_seconds = 60});
  ASSERT_TRUE(next.ok());
  EXPECT_EQ(next.value->sequence, loaded.value->sequence + 1);
}

TEST(subscription_store, pending_subscription_cannot_record_charges) {
  auto fixture = store_fixture{"pledge_store_pending_charge"};
  auto created = fixture.store.create(fixture.make_request());
  ASSERT_TRUE(created.ok());
  EXPECT_EQ(
      fixture.store.record_charge(created.value->id, fixture.success())
          .result.code,
      error_code::invalid_state);
  EXPECT_TRUE(fixture.store.history(created.value->id).empty());
}

TEST(subscription_store, charge_confirmed_after_pause_is_counted) {
  auto fixture = store_fixture{"pledge_store_pause_in_flight"};
  auto state = fixture.create_active(fixture.make_request());
  auto charged_at = fixture.clock.now.load();

  ASSERT_TRUE(fixture.store.pause(state.id).ok());
  auto recorded = fixture.store.record_charge(state.id, fixture.success());
  ASSERT_TRUE(recorded.ok()) << recorded.result.log;
  EXPECT_EQ(recorded.value->status, subscription_status_t::paused);
  EXPECT_EQ(recorded.value->payments_made, 1u);
  EXPECT_EQ(recorded.value->last_charged_at, charged_at);
  EXPECT_FALSE(recorded.value->next_charge_at.has_value());
  ASSERT_EQ(fixture.store.history(state.id).size(), 1u);
  EXPECT_TRUE(fixture.store.history(state.id).front().success);

  fixture.clock.advance(5000);
  auto resumed = fixture.store.resume(state.id);
  ASSERT_TRUE(resumed.ok());
  EXPECT_EQ(resumed.value->next_charge_at,
            charged_at + pledge::testing::kDayMilliseconds);
  EXPECT_TRUE(fixture.store.due(fixture.clock.now.load()).empty());
}

TEST(subscription_store, failure_after_pause_keeps_streak) {
  auto fixture = store_fixture{"pledge_store_pause_failure"};
  auto state = fixture.create_active(fixture.make_request());
  ASSERT_TRUE(fixture.store.pause(state.id).ok());

  auto recorded = fixture.store.record_charge(state.id, fixture.failure());
  ASSERT_TRUE(recorded.ok());
  EXPECT_EQ(recorded.value->status, subscription_status_t::paused);
  EXPECT_EQ(recorded.value->consecutive_failures, 0u);
  EXPECT_FALSE(recorded.value->needs_review);
  EXPECT_EQ(fixture.store.history(state.id).size(), 1u);
}

TEST(subscription_store, final_charge_after_pause_completes) {
  auto fixture = store_fixture{"pledge_store_pause_cap"};
  auto request = fixture.make_request();
  request.max_payments = 1;
  auto state = fixture.create_active(request);
  ASSERT_TRUE(fixture.store.pause(state.id).ok());

  auto recorded = fixture.store.record_charge(state.id, fixture.success());
  ASSERT_TRUE(recorded.ok());
  EXPECT_EQ(recorded.value->status, subscription_status_t::completed);
  EXPECT_EQ(recorded.value->payments_made, 1u);
  ASSERT_EQ(fixture.retired.size(), 1u);
  EXPECT_EQ(fixture.store.resume(state.id).result.code,
            error_code::invalid_state);
}

TEST(subscription_store, charge_confirmed_after_cancel_is_counted) {
  auto fixture = store_fixture{"pledge_store_cancel_in_flight"};
  auto request = fixture.make_request();
  request.max_payments = 1;
  auto state = fixture.create_active(request);
  ASSERT_TRUE(fixture.store.cancel(state.id).ok());

  auto recorded = fixture.store.record_charge(state.id, fixture.success());
  ASSERT_TRUE(recorded.ok());
  EXPECT_EQ(recorded.value->status, subscription_status_t::cancelled);
  EXPECT_EQ(recorded.value->payments_made, 1u);
  EXPECT_EQ(fixture.store.history(state.id).size(), 1u);
  EXPECT_EQ(fixture.retired.size(), 1u);
  EXPECT_TRUE(fixture.store.due(fixture.clock.now.load()).empty());
}

TEST(subscription_store, frequency_is_bounded) {
  auto fixture = store_fixture{"pledge_store_frequency_bound"};
  auto request = fixture.make_request();
  request.frequency_seconds = int64_t{18446744073709552};
  EXPECT_EQ(fixture.store.create(request).result.code,
            error_code::invalid_parameters);
  request.frequency_seconds = pledge::subscription::kMaxFrequencySeconds + 1;
  EXPECT_EQ(fixture.store.create(request).result.code,
            error_code::invalid_parameters);
  EXPECT_TRUE(fixture.store.list("alice.test").empty());

  request.frequency_seconds = pledge::subscription::kMaxFrequencySeconds;
  auto created = fixture.store.create(request);
  ASSERT_TRUE(created.ok()) << created.result.log;
  ASSERT_TRUE(
      fixture.store.authorize(created.value->id, pledge::testing::make_hash(1))
          .ok());
  auto charged =
      fixture.store.record_charge(created.value->id, fixture.success());
  ASSERT_TRUE(charged.ok());
  EXPECT_EQ(charged.value->next_charge_at,
            fixture.clock.now.load() +
                static_cast<uint64_t>(
                    pledge::subscription::kMaxFrequencySeconds) *
                    1000);
  EXPECT_TRUE(fixture.store.due(fixture.clock.now.load() +
                                pledge::testing::kDayMilliseconds)
                  .empty());
}
