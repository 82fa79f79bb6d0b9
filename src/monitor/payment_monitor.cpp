#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>
#include <pledge/ledger/signing.hpp>
#include <pledge/monitor/payment_monitor.hpp>
#include <pledge/schema/key/keys.hpp>

#include <algorithm>
#include <functional>
#include <future>
#include <memory>
#include <vector>

namespace pledge::monitor {

namespace {

using pledge::schema::error_code;
using pledge::schema::monitoring_status_t;

struct in_flight_guard final {
  std::function<void()> release;
  ~in_flight_guard() { release(); }
};

}  // namespace

payment_monitor::payment_monitor(
    pledge::subscription::subscription_store& store,
    pledge::vault::key_vault& vault,
    pledge::ledger::ledger_client& ledger,
    pledge::worker::worker_identity& worker,
    pledge::storage::rocksdb_storage_t& storage,
    pledge::common::clock_t clock,
    monitor_options options)
    : store_{store},
      vault_{vault},
      ledger_{ledger},
      worker_{worker},
      storage_{storage},
      clock_{std::move(clock)},
      options_{std::move(options)},
      timer_{io_},
      pool_{std::max<size_t>(options_.concurrency, 1)} {
  auto persisted = storage_.get<monitoring_status_t>(
      encoder_, pledge::schema::key::make_prefix_key(
                    encoder_, pledge::schema::key::kMonitoringStatusKey));
  if (persisted) {
    status_ = *persisted;
    resume_on_start_ = status_.is_monitoring;
    status_.is_monitoring = false;
  }
}

payment_monitor::~payment_monitor() {
  {
    auto lock = std::scoped_lock{lifecycle_mutex_};
    if (running_.exchange(false)) {
      boost::asio::post(io_, [this] { timer_.cancel(); });
      work_guard_.reset();
    }
  }
  if (timer_thread_.joinable()) {
    timer_thread_.join();
  }
  pool_.join();
}

void payment_monitor::persist_status(const monitoring_status_t& status) {
  storage_.put(encoder_,
               pledge::schema::key::make_prefix_key(
                   encoder_, pledge::schema::key::kMonitoringStatusKey),
               status);
}

pledge::schema::value_result<monitoring_status_t> payment_monitor::start(
    const std::optional<uint64_t> interval_ms) {
  if (interval_ms && *interval_ms == 0) {
    return pledge::schema::make_value_error<monitoring_status_t>(
        error_code::invalid_parameters, "interval must be positive",
        std::string{kMonitorCodespace});
  }

  auto lock = std::scoped_lock{lifecycle_mutex_};
  if (running_.load()) {
    spdlog::info("Payment monitor already running");
    return pledge::schema::value_result<monitoring_status_t>{
        .result = pledge::schema::make_ok("monitoring already running"),
        .value = status()};
  }

  // A previous run may still be finishing its last cycle.
  if (timer_thread_.joinable()) {
    timer_thread_.join();
  }

  auto current = monitoring_status_t{};
  {
    auto status_lock = std::scoped_lock{status_mutex_};
    if (interval_ms) {
      status_.interval_ms = *interval_ms;
    }
    status_.is_monitoring = true;
    current = status_;
  }
  persist_status(current);
  resume_on_start_ = false;

  io_.restart();
  work_guard_.emplace(io_.get_executor());
  running_.store(true);
  arm_timer(true);
  timer_thread_ = std::thread{[this] {
    spdlog::debug("Payment monitor timer thread started");
    io_.run();
    spdlog::debug("Payment monitor timer thread exited");
  }};

  spdlog::info("Payment monitor started, interval {} ms", current.interval_ms);
  return pledge::schema::value_result<monitoring_status_t>{
      .result = pledge::schema::make_ok("monitoring started"),
      .value = current};
}

monitoring_status_t payment_monitor::stop() {
  auto lock = std::scoped_lock{lifecycle_mutex_};
  if (running_.exchange(false)) {
    boost::asio::post(io_, [this] { timer_.cancel(); });
    work_guard_.reset();
    spdlog::info("Payment monitor stopped");
  }
  auto current = monitoring_status_t{};
  {
    auto status_lock = std::scoped_lock{status_mutex_};
    status_.is_monitoring = false;
    current = status_;
  }
  persist_status(current);
  return current;
}

monitoring_status_t payment_monitor::status() {
  auto lock = std::scoped_lock{status_mutex_};
  return status_;
}

bool payment_monitor::resume_if_persisted() {
  auto resume = false;
  {
    auto lock = std::scoped_lock{lifecycle_mutex_};
    resume = resume_on_start_;
  }
  if (!resume) {
    return false;
  }
  spdlog::info("Resuming payment monitor after restart");
  return start().ok();
}

void payment_monitor::arm_timer(const bool immediate) {
  auto interval = std::chrono::milliseconds{status().interval_ms};
  auto now = boost::asio::steady_timer::clock_type::now();
  if (immediate) {
    timer_.expires_at(now);
  } else {
    auto next = timer_.expiry() + interval;
    // An overrunning cycle skips the ticks it missed instead of bunching them.
    timer_.expires_at(next < now ? now + interval : next);
  }
  timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted || !running_.load()) {
      return;
    }
    if (ec) {
      spdlog::error("Payment monitor timer failed: {}", ec.message());
      return;
    }
    run_cycle();
    if (running_.load()) {
      arm_timer(false);
    }
  });
}

bool payment_monitor::acquire(const pledge::schema::subscription_id_t& id) {
  auto lock = std::scoped_lock{in_flight_mutex_};
  return in_flight_.insert(id).second;
}

void payment_monitor::release(const pledge::schema::subscription_id_t& id) {
  auto lock = std::scoped_lock{in_flight_mutex_};
  in_flight_.erase(id);
}

cycle_report payment_monitor::run_cycle() {
  auto report = cycle_report{};
  auto now = clock_();

  if (options_.require_verified_worker && !worker_.is_verified()) {
    auto verified = worker_.verify();
    if (!verified.ok() || !verified.value->verified) {
      report.error = "worker is not verified; refusing to charge";
      spdlog::warn("Skipping payment cycle: worker is not verified");
    }
  }

  if (!report.error) {
    auto due = store_.due(now);
    report.due = due.size();
    if (!due.empty()) {
      spdlog::info("Payment cycle found {} due subscription(s)", due.size());
    }

    auto results = std::vector<std::future<charge_result>>{};
    results.reserve(due.size());
    for (const auto& subscription : due) {
      auto task = std::make_shared<std::packaged_task<charge_result()>>(
          [this, id = subscription.id, now] { return charge(id, now); });
      results.push_back(task->get_future());
      boost::asio::post(pool_, [task] { (*task)(); });
    }

    for (auto& result : results) {
      switch (result.get()) {
        case charge_result::succeeded:
          ++report.succeeded;
          break;
        case charge_result::failed:
          ++report.failed;
          break;
        case charge_result::skipped:
          ++report.skipped;
          break;
        case charge_result::enclave_unavailable:
          ++report.skipped;
          report.error = "enclave unavailable; charges deferred";
          break;
      }
    }
  }

  auto current = monitoring_status_t{};
  {
    auto lock = std::scoped_lock{status_mutex_};
    status_.last_run_at = now;
    status_.last_error = report.error;
    current = status_;
  }
  persist_status(current);

  spdlog::debug("Payment cycle done: due={} succeeded={} failed={} skipped={}",
                report.due, report.succeeded, report.failed, report.skipped);
  return report;
}

payment_monitor::charge_result payment_monitor::charge(
    const pledge::schema::subscription_id_t& id,
    const pledge::schema::timestamp_milliseconds_t now) {
  if (!acquire(id)) {
    spdlog::debug("Charge for {} already in flight", id);
    return charge_result::skipped;
  }
  auto guard = in_flight_guard{[this, &id] { release(id); }};

  // Another cycle may have charged, paused or cancelled it since the scan.
  auto current = store_.get(id);
  if (!current.ok()) {
    return charge_result::skipped;
  }
  const auto& subscription = *current.value;
  if (subscription.status != pledge::schema::subscription_status_t::active ||
      !subscription.next_charge_at || *subscription.next_charge_at > now ||
      !subscription.authorized_public_key) {
    return charge_result::skipped;
  }

  auto record = [&](const bool success, std::string message,
                    std::optional<pledge::schema::hash32_t> transaction_hash) {
    auto recorded = store_.record_charge(
        id, pledge::subscription::charge_outcome{
                .success = success,
                .timestamp = now,
                .message = std::move(message),
                .transaction_hash = transaction_hash});
    if (!recorded.ok()) {
      spdlog::warn("Could not record charge for {}: {}", id,
                   recorded.result.log);
    }
    return success ? charge_result::succeeded : charge_result::failed;
  };

  auto nonce = ledger_.access_key_nonce(subscription.payer_account_id,
                                        *subscription.authorized_public_key);
  if (!nonce) {
    return record(false, "scoped key not found on ledger", std::nullopt);
  }

  auto args = pledge::schema::process_payment_args_t{
      .subscription_id = id,
      .amount = subscription.amount,
      .token_address = subscription.token_address};
  auto transaction = pledge::schema::transaction_t{
      .signer_id = subscription.payer_account_id,
      .public_key = subscription.authorized_public_key,
      .nonce = *nonce + 1,
      .receiver_id = options_.contract_id,
      .actions = {pledge::schema::function_call_action_t{
          .method_name = std::string{pledge::schema::kProcessPaymentMethod},
          .args = encoder_.encode(args),
          .gas = options_.gas,
          .deposit = 0}}};

  auto payload =
      pledge::ledger::make_signing_payload(encoder_, transaction);
  auto signature = vault_.sign(id, payload);
  if (!signature.ok()) {
    if (signature.result.code == error_code::enclave_unavailable) {
      spdlog::error("Enclave unavailable signing charge for {}: {}", id,
                    signature.result.log);
      return charge_result::enclave_unavailable;
    }
    return record(false, signature.result.log, std::nullopt);
  }

  auto submitted = ledger_.submit(
      pledge::schema::signed_transaction_t{.transaction = std::move(transaction),
                                           .signature = *signature.value},
      options_.ledger_timeout);
  switch (submitted.status) {
    case pledge::ledger::submission_status_t::confirmed:
      return record(true, submitted.message, submitted.transaction_hash);
    case pledge::ledger::submission_status_t::timeout:
      spdlog::warn("Ledger timed out charging {}", id);
      return record(false, submitted.message, submitted.transaction_hash);
    case pledge::ledger::submission_status_t::rejected:
      spdlog::warn("Ledger rejected charge for {}: {}", id, submitted.message);
      return record(false, submitted.message, submitted.transaction_hash);
  }
  return record(false, "unknown submission status", std::nullopt);
}

}  // namespace pledge::monitor
