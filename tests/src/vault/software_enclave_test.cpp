#include <gtest/gtest.h>
#include <pledge/blake3/hash.hpp>
#include <pledge/schema/attestation_quote.hpp>
#include <pledge/schema/encoding/scale/encoder.hpp>
#include <pledge/testing/common.hpp>
#include <pledge/vault/software_enclave.hpp>

#include <filesystem>
#include <string_view>

TEST(software_enclave, sealed_data_opens_only_under_same_measurement) {
  auto directory = pledge::testing::temp_directory{"pledge_enclave_seal"};
  auto secret_path = std::filesystem::path{directory.path} / "platform.secret";
  auto enclave = pledge::vault::software_enclave{
      secret_path, pledge::testing::make_hash(1)};
  auto plaintext = pledge::schema::bytes_t{1, 2, 3};
  auto aad = pledge::schema::make_bytes(std::string_view{"sub-1"});

  auto sealed = enclave.seal(plaintext, aad);
  ASSERT_TRUE(sealed.has_value());

  // Restart with the same platform secret and measurement.
  auto restarted = pledge::vault::software_enclave{
      secret_path, pledge::testing::make_hash(1)};
  auto opened = restarted.unseal(*sealed, aad);
  ASSERT_TRUE(opened.has_value());
  EXPECT_EQ(*opened, plaintext);

  auto other_image = pledge::vault::software_enclave{
      secret_path, pledge::testing::make_hash(2)};
  EXPECT_FALSE(other_image.unseal(*sealed, aad).has_value());

  auto perms = std::filesystem::status(secret_path).permissions();
  EXPECT_EQ(perms & std::filesystem::perms::group_all,
            std::filesystem::perms::none);
  EXPECT_EQ(perms & std::filesystem::perms::others_all,
            std::filesystem::perms::none);
}

TEST(software_enclave, derived_secrets_are_stable_and_label_scoped) {
  auto directory = pledge::testing::temp_directory{"pledge_enclave_derive"};
  auto secret_path = std::filesystem::path{directory.path} / "platform.secret";
  auto enclave = pledge::vault::software_enclave{
      secret_path, pledge::testing::make_hash(1)};

  auto first = enclave.derive_secret("pledge/worker-account");
  auto again = enclave.derive_secret("pledge/worker-account");
  auto other = enclave.derive_secret("pledge/other");
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(again.has_value());
  ASSERT_TRUE(other.has_value());
  EXPECT_EQ(*first, *again);
  EXPECT_NE(*first, *other);
}

TEST(software_enclave, quote_commits_to_measurement_and_report_data) {
  auto directory = pledge::testing::temp_directory{"pledge_enclave_quote"};
  auto enclave = pledge::vault::software_enclave{
      std::filesystem::path{directory.path} / "platform.secret",
      pledge::testing::make_hash(5)};
  auto report_data = pledge::blake3::hash(std::string_view{"worker"});

  auto quote = enclave.quote(report_data);
  ASSERT_TRUE(quote.has_value());

  auto encoder = pledge::schema::encoding::scale_encoder_t{};
  auto decoded = encoder.try_decode<pledge::schema::attestation_quote_t>(
      pledge::schema::make_bytes_view(*quote));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->measurement, pledge::testing::make_hash(5));
  EXPECT_EQ(decoded->report_data, report_data);
  EXPECT_EQ(decoded->mac, pledge::vault::make_quote_mac(
                              pledge::testing::make_hash(5), report_data));
}

TEST(software_enclave, unavailable_enclave_refuses_every_operation) {
  auto directory = pledge::testing::temp_directory{"pledge_enclave_down"};
  auto enclave = pledge::vault::software_enclave{
      std::filesystem::path{directory.path} / "platform.secret",
      pledge::testing::make_hash(1)};
  auto plaintext = pledge::schema::bytes_t{1};
  auto sealed = enclave.seal(plaintext, {});
  ASSERT_TRUE(sealed.has_value());

  enclave.set_available(false);
  EXPECT_FALSE(enclave.available());
  EXPECT_FALSE(enclave.seal(plaintext, {}).has_value());
  EXPECT_FALSE(enclave.unseal(*sealed, {}).has_value());
  EXPECT_FALSE(enclave.derive_secret("label").has_value());
  EXPECT_FALSE(enclave.quote(pledge::testing::make_hash(1)).has_value());

  enclave.set_available(true);
  EXPECT_TRUE(enclave.unseal(*sealed, {}).has_value());
}
