#pragma once

#include <pledge/vault/enclave.hpp>

#include <atomic>
#include <filesystem>

namespace pledge::vault {

/// Development stand-in for a hardware enclave. Sealing keys are derived
/// from a host-local platform secret and the configured measurement, so
/// sealed records survive restarts only under the same measurement.
class software_enclave final : public enclave {
 public:
  software_enclave(const std::filesystem::path& platform_secret_path,
                   const pledge::schema::hash32_t& measurement);
  ~software_enclave() override;

  bool available() const override;
  pledge::schema::hash32_t measurement() const override;

  std::optional<pledge::schema::bytes_t> seal(
      const pledge::schema::bytes_view_t& plaintext,
      const pledge::schema::bytes_view_t& aad) override;
  std::optional<pledge::schema::bytes_t> unseal(
      const pledge::schema::bytes_view_t& sealed,
      const pledge::schema::bytes_view_t& aad) override;
  std::optional<pledge::crypto::ed25519_seed_t> derive_secret(
      std::string_view label) override;
  std::optional<pledge::schema::bytes_t> quote(
      const pledge::schema::hash32_t& report_data) override;

  /// Simulate the enclave runtime going away (or coming back).
  void set_available(bool available);

 private:
  pledge::schema::hash32_t derive(std::string_view label) const;

  pledge::schema::hash32_t platform_secret_{};
  pledge::schema::hash32_t measurement_{};
  std::atomic<bool> available_{true};
};

/// Digest the report data a quote commits to, shared with quote verifiers.
pledge::schema::hash32_t make_quote_mac(
    const pledge::schema::hash32_t& measurement,
    const pledge::schema::hash32_t& report_data);

}  // namespace pledge::vault
