#include <boost/program_options.hpp>
#include <pledge/config/options.hpp>
#include <pledge/issuer/scoped_key_issuer.hpp>

#include <sstream>

namespace pledge::config {

namespace po = boost::program_options;

std::optional<pledge::schema::merchant_t> try_parse_merchant(
    std::string_view text) {
  auto first = text.find(',');
  if (first == std::string_view::npos) {
    return std::nullopt;
  }
  auto second = text.find(',', first + 1);
  if (second == std::string_view::npos) {
    return std::nullopt;
  }
  auto merchant = pledge::schema::merchant_t{
      .id = std::string{text.substr(0, first)},
      .name = std::string{text.substr(first + 1, second - first - 1)},
      .payee_account_id = std::string{text.substr(second + 1)}};
  if (merchant.id.empty() || merchant.payee_account_id.empty()) {
    return std::nullopt;
  }
  return merchant;
}

parse_result parse(const int argc, const char* const argv[]) {
  auto result = parse_result{};
  auto& values = result.values;

  auto config_file = std::string{};
  auto data_dir = std::string{};
  auto default_allowance = std::string{};
  auto enclave_measurement = std::string{};
  auto allowed_measurements = std::vector<std::string>{};
  auto merchants = std::vector<std::string>{};
  auto log_level = std::string{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"Pledge"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI file with any of the options below")(
      "grpc-address,g",
      po::value<std::string>(&values.grpc_address)
          ->default_value(values.grpc_address),
      "IP:Port for the gRPC service")(
      "data-dir,d",
      po::value<std::string>(&data_dir)->default_value(
          values.data_dir.string()),
      "Directory for state and sealed key storage")(
      "contract-id",
      po::value<std::string>(&values.contract_id)
          ->default_value(values.contract_id),
      "Ledger account of the subscription contract")(
      "monitor-interval-ms",
      po::value<uint64_t>(&values.monitor_interval_ms)
          ->default_value(values.monitor_interval_ms),
      "Payment monitor interval")(
      "monitor-concurrency",
      po::value<size_t>(&values.monitor_concurrency)
          ->default_value(values.monitor_concurrency),
      "Maximum concurrent charges per cycle")(
      "ledger-timeout-ms",
      po::value<uint64_t>(&values.ledger_timeout_ms)
          ->default_value(values.ledger_timeout_ms),
      "Timeout for one ledger submission")(
      "default-allowance",
      po::value<std::string>(&default_allowance)
          ->default_value(std::string{pledge::issuer::kDefaultAllowance}),
      "Scoped key allowance in the smallest token unit")(
      "retry-base-ms",
      po::value<uint64_t>(&values.retry_base_ms)
          ->default_value(values.retry_base_ms),
      "First retry delay after a failed charge")(
      "retry-cap-ms",
      po::value<uint64_t>(&values.retry_cap_ms)
          ->default_value(values.retry_cap_ms),
      "Upper bound on the retry delay")(
      "retry-max-failures",
      po::value<uint32_t>(&values.retry_max_failures)
          ->default_value(values.retry_max_failures),
      "Consecutive failures before a subscription is paused for review")(
      "require-verified-worker",
      po::value<bool>(&values.require_verified_worker)
          ->default_value(values.require_verified_worker),
      "Refuse to start or charge without on-chain worker verification")(
      "autostart-monitor",
      po::value<bool>(&values.autostart_monitor)
          ->default_value(values.autostart_monitor),
      "Start the payment monitor at launch")(
      "enclave-measurement", po::value<std::string>(&enclave_measurement),
      "Software enclave measurement (64 hex characters)")(
      "allowed-measurement",
      po::value<std::vector<std::string>>(&allowed_measurements)->composing(),
      "Measurement accepted by the simulated ledger (repeatable)")(
      "merchant", po::value<std::vector<std::string>>(&merchants)->composing(),
      "Merchant seeded into the simulated ledger as id,name,payee "
      "(repeatable)")(
      "log-file",
      po::value<std::string>(&values.log_file)->default_value(values.log_file),
      "Log file path")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace, debug, info, warn, error or critical")(
      "verbose,v", "Enable verbose output");

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      po::store(po::parse_config_file(
                    vm["config"].as<std::string>().c_str(), description),
                vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    result.message = e.what();
    return result;
  }

  if (vm.contains("help")) {
    auto out = std::ostringstream{};
    out << description;
    result.status = parse_status::help;
    result.message = out.str();
    return result;
  }

  values.data_dir = data_dir;
  values.verbose = vm.contains("verbose");

  auto allowance = pledge::schema::try_make_amount(default_allowance);
  if (!allowance || *allowance == 0) {
    result.message = "default-allowance must be a positive integer";
    return result;
  }
  values.default_allowance = *allowance;

  if (!enclave_measurement.empty()) {
    values.enclave_measurement =
        pledge::schema::try_make_hash32(enclave_measurement);
    if (!values.enclave_measurement) {
      result.message = "enclave-measurement must be 64 hex characters";
      return result;
    }
  }
  for (const auto& text : allowed_measurements) {
    auto measurement = pledge::schema::try_make_hash32(text);
    if (!measurement) {
      result.message = "allowed-measurement must be 64 hex characters";
      return result;
    }
    values.allowed_measurements.push_back(*measurement);
  }
  for (const auto& text : merchants) {
    auto merchant = try_parse_merchant(text);
    if (!merchant) {
      result.message = "merchant must be given as id,name,payee";
      return result;
    }
    values.merchants.push_back(std::move(*merchant));
  }

  values.log_level = spdlog::level::from_str(log_level);
  if (values.log_level == spdlog::level::off && log_level != "off") {
    result.message = "unknown log-level " + log_level;
    return result;
  }
  if (values.verbose) {
    values.log_level = spdlog::level::debug;
  }

  if (values.monitor_interval_ms == 0 || values.monitor_concurrency == 0 ||
      values.ledger_timeout_ms == 0 || values.retry_base_ms == 0 ||
      values.retry_cap_ms < values.retry_base_ms ||
      values.retry_max_failures == 0) {
    result.message =
        "numeric limits must be positive and retry-cap-ms at least retry-base-ms";
    return result;
  }

  result.status = parse_status::ok;
  return result;
}

}  // namespace pledge::config
