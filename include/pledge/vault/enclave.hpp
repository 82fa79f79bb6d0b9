#pragma once

#include <pledge/crypto/ed25519.hpp>
#include <pledge/schema/primitives.hpp>

#include <optional>
#include <string_view>

namespace pledge::vault {

/// Trusted execution boundary used for key custody and worker identity.
///
/// Every call may fail when the enclave runtime is unreachable; failures are
/// reported as std::nullopt and mapped to `enclave_unavailable` by callers.
class enclave {
 public:
  virtual ~enclave() = default;

  virtual bool available() const = 0;

  /// Code identity of the running enclave image.
  virtual pledge::schema::hash32_t measurement() const = 0;

  /// Encrypt for this enclave image only. `aad` is bound but not encrypted.
  virtual std::optional<pledge::schema::bytes_t> seal(
      const pledge::schema::bytes_view_t& plaintext,
      const pledge::schema::bytes_view_t& aad) = 0;

  virtual std::optional<pledge::schema::bytes_t> unseal(
      const pledge::schema::bytes_view_t& sealed,
      const pledge::schema::bytes_view_t& aad) = 0;

  /// Deterministic per (enclave image, label).
  virtual std::optional<pledge::crypto::ed25519_seed_t> derive_secret(
      std::string_view label) = 0;

  /// Attestation quote committing to `report_data`.
  virtual std::optional<pledge::schema::bytes_t> quote(
      const pledge::schema::hash32_t& report_data) = 0;
};

}  // namespace pledge::vault
