#pragma once

#include <spdlog/common.h>
#include <pledge/schema/merchant.hpp>
#include <pledge/schema/primitives.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pledge::config {

/// Runtime configuration for the service executable.
struct options final {
  std::string grpc_address{"0.0.0.0:50051"};
  std::filesystem::path data_dir{"pledge-data"};
  pledge::schema::account_id_t contract_id{"pledge.testnet"};
  uint64_t monitor_interval_ms{60000};
  size_t monitor_concurrency{4};
  uint64_t ledger_timeout_ms{30000};
  pledge::schema::amount_t default_allowance{};
  uint64_t retry_base_ms{60000};
  uint64_t retry_cap_ms{3600000};
  uint32_t retry_max_failures{5};
  bool require_verified_worker{true};
  bool autostart_monitor{false};
  /// Software enclave only; hardware enclaves report their own measurement.
  std::optional<pledge::schema::hash32_t> enclave_measurement;
  /// Simulated ledger attestation allow-list.
  std::vector<pledge::schema::hash32_t> allowed_measurements;
  /// Simulated ledger merchant registry.
  std::vector<pledge::schema::merchant_t> merchants;
  std::string log_file{"pledge.log"};
  spdlog::level::level_enum log_level{spdlog::level::info};
  bool verbose{false};
};

enum class parse_status : uint8_t { ok, help, error };

struct parse_result final {
  parse_status status{parse_status::error};
  options values;
  /// Help text or the reason parsing failed.
  std::string message;
};

/// Parse the command line and, when `--config` names one, an INI file.
/// Command line values take precedence over the file.
parse_result parse(int argc, const char* const argv[]);

/// Parse `id,name,payee` into a merchant.
std::optional<pledge::schema::merchant_t> try_parse_merchant(
    std::string_view text);

}  // namespace pledge::config
