#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <pledge/blake3/hash.hpp>
#include <pledge/config/options.hpp>
#include <pledge/issuer/scoped_key_issuer.hpp>
#include <pledge/ledger/simulated_ledger.hpp>
#include <pledge/monitor/payment_monitor.hpp>
#include <pledge/rpc/server.hpp>
#include <pledge/service/service.hpp>
#include <pledge/storage/rocksdb/storage.hpp>
#include <pledge/subscription/store.hpp>
#include <pledge/vault/key_vault.hpp>
#include <pledge/vault/software_enclave.hpp>
#include <pledge/worker/worker_identity.hpp>
#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

namespace {

int run(const pledge::config::options& options) {
  std::filesystem::create_directories(options.data_dir);
  auto state_storage =
      pledge::storage::make_storage<pledge::storage::rocksdb_storage_tag>(
          (options.data_dir / "state").string());
  auto sealed_storage =
      pledge::storage::make_storage<pledge::storage::rocksdb_storage_tag>(
          (options.data_dir / "sealed").string());

  auto measurement = options.enclave_measurement.value_or(
      pledge::blake3::hash(std::string_view{"pledge/software-enclave"}));
  auto enclave = pledge::vault::software_enclave{
      options.data_dir / "platform.secret", measurement};

  auto allowed_measurements = options.allowed_measurements;
  if (allowed_measurements.empty()) {
    spdlog::warn("No allowed-measurement configured; allow-listing {}",
                 pledge::schema::to_hex(measurement));
    allowed_measurements.push_back(measurement);
  }
  auto ledger = pledge::ledger::simulated_ledger{
      pledge::ledger::simulated_ledger_options{
          .contract_id = options.contract_id,
          .allowed_measurements = std::move(allowed_measurements)}};
  for (const auto& merchant : options.merchants) {
    ledger.add_merchant(merchant);
  }

  auto clock = pledge::common::system_clock();
  auto vault = pledge::vault::key_vault{sealed_storage, enclave, clock};
  auto store = pledge::subscription::subscription_store{
      state_storage, clock,
      pledge::subscription::retry_policy{
          .base_delay_ms = options.retry_base_ms,
          .max_delay_ms = options.retry_cap_ms,
          .max_consecutive_failures = options.retry_max_failures}};
  auto issuer = pledge::issuer::scoped_key_issuer{options.default_allowance};
  auto worker = pledge::worker::worker_identity{enclave, ledger};
  auto monitor = pledge::monitor::payment_monitor{
      store,
      vault,
      ledger,
      worker,
      state_storage,
      clock,
      pledge::monitor::monitor_options{
          .contract_id = options.contract_id,
          .concurrency = options.monitor_concurrency,
          .ledger_timeout =
              std::chrono::milliseconds{options.ledger_timeout_ms},
          .require_verified_worker = options.require_verified_worker}};
  auto service = pledge::service::service{store,  vault,   issuer,
                                          ledger, worker,  monitor,
                                          options.contract_id};

  // Worker identity: derive -> register -> verify.
  auto derived = worker.derive();
  if (!derived.ok()) {
    spdlog::critical("Worker identity unavailable: {}", derived.result.log);
    return 1;
  }
  auto verified = worker.verify();
  if (!verified.ok() || !verified.value->verified) {
    auto registered = worker.register_worker();
    if (registered.ok()) {
      verified = worker.verify();
    } else if (options.require_verified_worker) {
      spdlog::critical("Worker registration failed: {}",
                       registered.result.log);
      return 1;
    }
  }
  if (options.require_verified_worker &&
      (!verified.ok() || !verified.value->verified)) {
    spdlog::warn(
        "Worker {} is not verified yet; charges wait for verification",
        derived.value->account_id);
  }

  if (options.autostart_monitor) {
    auto started = monitor.start(options.monitor_interval_ms);
    if (!started.ok()) {
      spdlog::error("Could not start payment monitor: {}",
                    started.result.log);
    }
  } else {
    monitor.resume_if_persisted();
  }

  spdlog::info("gRPC service listening on {}", options.grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = pledge::rpc::listener{service};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(options.grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC server on {}",
                     options.grpc_address);
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  // Leave the persisted status alone so a restart resumes monitoring.
  spdlog::info("Shutting down");
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto parsed = pledge::config::parse(argc, argv);
  if (parsed.status == pledge::config::parse_status::help) {
    std::cout << parsed.message << std::endl;
    return 0;
  }
  if (parsed.status == pledge::config::parse_status::error) {
    std::cerr << "invalid configuration: " << parsed.message << std::endl;
    return 1;
  }
  const auto& options = parsed.values;

  std::signal(SIGINT, signal_handler);

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options.log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "main", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(options.log_level);

  auto exit_code = run(options);
  spdlog::shutdown();
  return exit_code;
}
