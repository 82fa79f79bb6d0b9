#include <openssl/crypto.h>
#include <spdlog/spdlog.h>
#include <pledge/blake3/hash.hpp>
#include <pledge/common/critical.hpp>
#include <pledge/crypto/aead.hpp>
#include <pledge/schema/attestation_quote.hpp>
#include <pledge/schema/encoding/scale/encoder.hpp>
#include <pledge/vault/software_enclave.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>

namespace pledge::vault {

namespace {

constexpr auto kSealingLabel = std::string_view{"pledge/seal"};
constexpr auto kQuoteLabel = std::string_view{"pledge/quote"};

pledge::schema::hash32_t load_platform_secret(
    const std::filesystem::path& path) {
  auto secret = pledge::schema::hash32_t{};
  if (std::filesystem::exists(path)) {
    auto in = std::ifstream{path, std::ios::binary};
    auto contents = pledge::schema::bytes_t{std::istreambuf_iterator<char>{in},
                                            std::istreambuf_iterator<char>{}};
    if (!in.good() && !in.eof()) {
      pledge::common::critical("failed to read platform secret");
    }
    if (contents.size() != secret.size()) {
      spdlog::error("Platform secret at {} has {} bytes, expected {}",
                    path.string(), contents.size(), secret.size());
      pledge::common::critical("platform secret is corrupt");
    }
    std::copy(contents.begin(), contents.end(), secret.begin());
    OPENSSL_cleanse(contents.data(), contents.size());
    return secret;
  }

  auto fresh = pledge::crypto::random_bytes(secret.size());
  if (!fresh) {
    pledge::common::critical("failed to generate platform secret");
  }
  std::copy(fresh->begin(), fresh->end(), secret.begin());
  OPENSSL_cleanse(fresh->data(), fresh->size());

  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  {
    auto out = std::ofstream{path, std::ios::binary | std::ios::trunc};
    out.write(reinterpret_cast<const char*>(secret.data()),
              static_cast<std::streamsize>(secret.size()));
    if (!out) {
      pledge::common::critical("failed to write platform secret");
    }
  }
  std::filesystem::permissions(path,
                               std::filesystem::perms::owner_read |
                                   std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace);
  spdlog::info("Created platform secret at {}", path.string());
  return secret;
}

}  // namespace

pledge::schema::hash32_t make_quote_mac(
    const pledge::schema::hash32_t& measurement,
    const pledge::schema::hash32_t& report_data) {
  return pledge::blake3::hash(
      {pledge::schema::make_bytes_view(kQuoteLabel), measurement, report_data});
}

software_enclave::software_enclave(
    const std::filesystem::path& platform_secret_path,
    const pledge::schema::hash32_t& measurement)
    : platform_secret_{load_platform_secret(platform_secret_path)},
      measurement_{measurement} {
  spdlog::info("Software enclave measurement {}",
               pledge::schema::to_hex(measurement_));
}

software_enclave::~software_enclave() {
  OPENSSL_cleanse(platform_secret_.data(), platform_secret_.size());
}

bool software_enclave::available() const {
  return available_.load();
}

void software_enclave::set_available(const bool available) {
  available_.store(available);
}

pledge::schema::hash32_t software_enclave::measurement() const {
  return measurement_;
}

pledge::schema::hash32_t software_enclave::derive(
    const std::string_view label) const {
  return pledge::blake3::hash({platform_secret_, measurement_,
                               pledge::schema::make_bytes_view(label)});
}

std::optional<pledge::schema::bytes_t> software_enclave::seal(
    const pledge::schema::bytes_view_t& plaintext,
    const pledge::schema::bytes_view_t& aad) {
  if (!available()) {
    return std::nullopt;
  }
  auto key = derive(kSealingLabel);
  auto sealed = pledge::crypto::seal(key, plaintext, aad);
  OPENSSL_cleanse(key.data(), key.size());
  return sealed;
}

std::optional<pledge::schema::bytes_t> software_enclave::unseal(
    const pledge::schema::bytes_view_t& sealed,
    const pledge::schema::bytes_view_t& aad) {
  if (!available()) {
    return std::nullopt;
  }
  auto key = derive(kSealingLabel);
  auto opened = pledge::crypto::open(key, sealed, aad);
  OPENSSL_cleanse(key.data(), key.size());
  return opened;
}

std::optional<pledge::crypto::ed25519_seed_t> software_enclave::derive_secret(
    const std::string_view label) {
  if (!available()) {
    return std::nullopt;
  }
  return derive(label);
}

std::optional<pledge::schema::bytes_t> software_enclave::quote(
    const pledge::schema::hash32_t& report_data) {
  if (!available()) {
    return std::nullopt;
  }
  auto encoder = pledge::schema::encoding::scale_encoder_t{};
  return encoder.encode(pledge::schema::attestation_quote_t{
      .measurement = measurement_,
      .report_data = report_data,
      .mac = make_quote_mac(measurement_, report_data)});
}

}  // namespace pledge::vault
