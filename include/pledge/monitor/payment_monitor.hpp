#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include <pledge/common/clock.hpp>
#include <pledge/ledger/ledger_client.hpp>
#include <pledge/schema/encoding/scale/encoder.hpp>
#include <pledge/schema/monitoring_status.hpp>
#include <pledge/storage/rocksdb/storage.hpp>
#include <pledge/subscription/store.hpp>
#include <pledge/vault/key_vault.hpp>
#include <pledge/worker/worker_identity.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <set>
#include <thread>

namespace pledge::monitor {

inline constexpr auto kMonitorCodespace = std::string_view{"pledge.monitor"};

/// 30 Tgas, the usual attached gas for a single contract call.
inline constexpr auto kDefaultPaymentGas = uint64_t{30000000000000};

struct monitor_options final {
  pledge::schema::account_id_t contract_id;
  size_t concurrency{4};
  std::chrono::milliseconds ledger_timeout{30000};
  uint64_t gas{kDefaultPaymentGas};
  bool require_verified_worker{true};
};

struct cycle_report final {
  size_t due{};
  size_t succeeded{};
  size_t failed{};
  size_t skipped{};
  std::optional<std::string> error;
};

/// Periodic charge scheduler.
///
/// A steady_timer on a dedicated io_context thread drives one cycle per
/// interval. Each cycle charges every due subscription on a bounded thread
/// pool. A per-subscription in-flight set keeps two overlapping cycles from
/// charging the same subscription twice.
class payment_monitor final {
 public:
  payment_monitor(pledge::subscription::subscription_store& store,
                  pledge::vault::key_vault& vault,
                  pledge::ledger::ledger_client& ledger,
                  pledge::worker::worker_identity& worker,
                  pledge::storage::rocksdb_storage_t& storage,
                  pledge::common::clock_t clock,
                  monitor_options options);
  ~payment_monitor();

  payment_monitor(const payment_monitor&) = delete;
  payment_monitor& operator=(const payment_monitor&) = delete;

  /// Start the timer. Starting a running monitor returns its current state
  /// unchanged. Without an interval the last persisted one is used.
  pledge::schema::value_result<pledge::schema::monitoring_status_t> start(
      std::optional<uint64_t> interval_ms = std::nullopt);

  /// Stop scheduling new cycles. A cycle already running finishes.
  pledge::schema::monitoring_status_t stop();

  pledge::schema::monitoring_status_t status();

  /// Resume monitoring if it was running when the process last exited.
  bool resume_if_persisted();

  /// Run one cycle on the calling thread. Safe to call while the timer runs.
  cycle_report run_cycle();

 private:
  enum class charge_result : uint8_t {
    succeeded,
    failed,
    skipped,
    enclave_unavailable
  };

  charge_result charge(const pledge::schema::subscription_id_t& id,
                       pledge::schema::timestamp_milliseconds_t now);
  bool acquire(const pledge::schema::subscription_id_t& id);
  void release(const pledge::schema::subscription_id_t& id);
  void arm_timer(bool immediate);
  void persist_status(const pledge::schema::monitoring_status_t& status);

  pledge::subscription::subscription_store& store_;
  pledge::vault::key_vault& vault_;
  pledge::ledger::ledger_client& ledger_;
  pledge::worker::worker_identity& worker_;
  pledge::storage::rocksdb_storage_t& storage_;
  pledge::common::clock_t clock_;
  monitor_options options_;
  pledge::schema::encoding::scale_encoder_t encoder_;

  boost::asio::io_context io_;
  boost::asio::steady_timer timer_;
  std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::thread timer_thread_;
  boost::asio::thread_pool pool_;

  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};
  bool resume_on_start_{false};

  std::mutex status_mutex_;
  pledge::schema::monitoring_status_t status_;

  std::mutex in_flight_mutex_;
  std::set<pledge::schema::subscription_id_t> in_flight_;
};

}  // namespace pledge::monitor
