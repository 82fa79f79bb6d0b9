#include <gtest/gtest.h>
#include <pledge/config/options.hpp>
#include <pledge/schema/primitives.hpp>
#include <pledge/testing/common.hpp>

#include <fstream>
#include <string>
#include <vector>

namespace {

pledge::config::parse_result parse(std::vector<std::string> arguments) {
  arguments.insert(arguments.begin(), "pledge");
  auto argv = std::vector<const char*>{};
  for (const auto& argument : arguments) {
    argv.push_back(argument.c_str());
  }
  return pledge::config::parse(static_cast<int>(argv.size()), argv.data());
}

constexpr auto kMeasurement = std::string_view{
    "0707070707070707070707070707070707070707070707070707070707070707"};

}  // namespace

TEST(config, defaults) {
  auto parsed = parse({});
  ASSERT_EQ(parsed.status, pledge::config::parse_status::ok) << parsed.message;
  const auto& values = parsed.values;
  EXPECT_EQ(values.grpc_address, "0.0.0.0:50051");
  EXPECT_EQ(values.contract_id, "pledge.testnet");
  EXPECT_EQ(values.monitor_interval_ms, 60000u);
  EXPECT_EQ(values.retry_base_ms, 60000u);
  EXPECT_EQ(values.retry_cap_ms, 3600000u);
  EXPECT_EQ(values.retry_max_failures, 5u);
  EXPECT_TRUE(values.require_verified_worker);
  EXPECT_FALSE(values.autostart_monitor);
  EXPECT_EQ(pledge::schema::to_string(values.default_allowance),
            "250000000000000000000000");
  EXPECT_FALSE(values.enclave_measurement.has_value());
  EXPECT_TRUE(values.merchants.empty());
  EXPECT_EQ(values.log_level, spdlog::level::info);
}

TEST(config, command_line_overrides) {
  auto parsed = parse({"--grpc-address", "127.0.0.1:6000", "--contract-id",
                       "subs.near", "--monitor-interval-ms", "5000",
                       "--autostart-monitor", "true", "--enclave-measurement",
                       std::string{kMeasurement}, "--allowed-measurement",
                       std::string{kMeasurement}, "--merchant",
                       "m1,Merchant One,m1.near", "--merchant",
                       "m2,Merchant Two,m2.near", "--log-level", "warn"});
  ASSERT_EQ(parsed.status, pledge::config::parse_status::ok) << parsed.message;
  const auto& values = parsed.values;
  EXPECT_EQ(values.grpc_address, "127.0.0.1:6000");
  EXPECT_EQ(values.contract_id, "subs.near");
  EXPECT_EQ(values.monitor_interval_ms, 5000u);
  EXPECT_TRUE(values.autostart_monitor);
  ASSERT_TRUE(values.enclave_measurement.has_value());
  EXPECT_EQ(*values.enclave_measurement,
            *pledge::schema::try_make_hash32(kMeasurement));
  ASSERT_EQ(values.allowed_measurements.size(), 1u);
  ASSERT_EQ(values.merchants.size(), 2u);
  EXPECT_EQ(values.merchants[1].id, "m2");
  EXPECT_EQ(values.merchants[1].name, "Merchant Two");
  EXPECT_EQ(values.merchants[1].payee_account_id, "m2.near");
  EXPECT_EQ(values.log_level, spdlog::level::warn);
}

TEST(config, verbose_forces_debug) {
  auto parsed = parse({"-v", "--log-level", "error"});
  ASSERT_EQ(parsed.status, pledge::config::parse_status::ok);
  EXPECT_TRUE(parsed.values.verbose);
  EXPECT_EQ(parsed.values.log_level, spdlog::level::debug);
}

TEST(config, merchant_text) {
  auto merchant = pledge::config::try_parse_merchant("m1,,payee.near");
  ASSERT_TRUE(merchant.has_value());
  EXPECT_EQ(merchant->id, "m1");
  EXPECT_TRUE(merchant->name.empty());

  EXPECT_FALSE(pledge::config::try_parse_merchant("m1").has_value());
  EXPECT_FALSE(pledge::config::try_parse_merchant("m1,name").has_value());
  EXPECT_FALSE(pledge::config::try_parse_merchant(",name,payee").has_value());
  EXPECT_FALSE(pledge::config::try_parse_merchant("m1,name,").has_value());
}

TEST(config, rejects_invalid_values) {
  EXPECT_EQ(parse({"--default-allowance", "0"}).status,
            pledge::config::parse_status::error);
  EXPECT_EQ(parse({"--default-allowance", "1.5"}).status,
            pledge::config::parse_status::error);
  EXPECT_EQ(parse({"--enclave-measurement", "abcd"}).status,
            pledge::config::parse_status::error);
  EXPECT_EQ(parse({"--allowed-measurement", "zz"}).status,
            pledge::config::parse_status::error);
  EXPECT_EQ(parse({"--merchant", "m1"}).status,
            pledge::config::parse_status::error);
  EXPECT_EQ(parse({"--log-level", "loud"}).status,
            pledge::config::parse_status::error);
  EXPECT_EQ(parse({"--monitor-concurrency", "0"}).status,
            pledge::config::parse_status::error);
  EXPECT_EQ(parse({"--retry-base-ms", "5000", "--retry-cap-ms", "1000"}).status,
            pledge::config::parse_status::error);
  EXPECT_EQ(parse({"--no-such-option"}).status,
            pledge::config::parse_status::error);
}

TEST(config, help_returns_usage) {
  auto parsed = parse({"--help"});
  EXPECT_EQ(parsed.status, pledge::config::parse_status::help);
  EXPECT_NE(parsed.message.find("--monitor-interval-ms"), std::string::npos);
}

TEST(config, reads_config_file) {
  auto directory = pledge::testing::temp_directory{"pledge_config_file"};
  auto path = directory.path + "/pledge.ini";
  {
    auto out = std::ofstream{path};
    out << "contract-id = file.near\n"
        << "monitor-interval-ms = 1500\n"
        << "merchant = m9,Ninth,m9.near\n";
  }
  auto parsed = parse({"--config", path, "--monitor-interval-ms", "2500"});
  ASSERT_EQ(parsed.status, pledge::config::parse_status::ok) << parsed.message;
  EXPECT_EQ(parsed.values.contract_id, "file.near");
  EXPECT_EQ(parsed.values.monitor_interval_ms, 2500u);
  ASSERT_EQ(parsed.values.merchants.size(), 1u);
  EXPECT_EQ(parsed.values.merchants.front().id, "m9");
}
