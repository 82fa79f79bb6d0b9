#pragma once

#include <pledge/common/clock.hpp>
#include <pledge/crypto/ed25519.hpp>
#include <pledge/schema/encoding/scale/encoder.hpp>
#include <pledge/schema/operation_result.hpp>
#include <pledge/schema/primitives.hpp>
#include <pledge/storage/rocksdb/storage.hpp>
#include <pledge/vault/enclave.hpp>

#include <mutex>
#include <optional>

namespace pledge::vault {

inline constexpr auto kVaultCodespace = std::string_view{"pledge.vault"};

class key_vault;

/// Signing capability for one custodied subscription key. Holds no key
/// material; every signature is produced inside the vault.
class signer final {
 public:
  const pledge::schema::subscription_id_t& subscription_id() const {
    return subscription_id_;
  }
  const pledge::schema::ed25519_public_key_t& public_key() const {
    return public_key_;
  }

  pledge::schema::value_result<pledge::schema::ed25519_signature_t> sign(
      const pledge::schema::bytes_view_t& payload) const;

 private:
  friend class key_vault;
  signer(key_vault& vault,
         pledge::schema::subscription_id_t subscription_id,
         const pledge::schema::ed25519_public_key_t& public_key);

  key_vault* vault_;
  pledge::schema::subscription_id_t subscription_id_;
  pledge::schema::ed25519_public_key_t public_key_;
};

/// Custody of scoped subscription keys. Private keys enter through `store`
/// and never leave: records are sealed by the enclave before they touch
/// storage, and the only use of a stored key is `sign`.
class key_vault final {
 public:
  key_vault(pledge::storage::rocksdb_storage_t& storage,
            enclave& enclave,
            pledge::common::clock_t clock);

  /// Take custody of `key` for `subscription_id`. A second store for the
  /// same id fails with `already_stored` and leaves the first key in place.
  pledge::schema::operation_result_t store(
      const pledge::schema::subscription_id_t& subscription_id,
      pledge::crypto::secret_key&& key,
      const pledge::schema::ed25519_public_key_t& public_key);

  pledge::schema::value_result<pledge::schema::ed25519_signature_t> sign(
      const pledge::schema::subscription_id_t& subscription_id,
      const pledge::schema::bytes_view_t& payload);

  std::optional<signer> signer_for(
      const pledge::schema::subscription_id_t& subscription_id);

  /// Irreversibly remove the key. Returns false when nothing was stored.
  bool destroy(const pledge::schema::subscription_id_t& subscription_id);

  bool contains(const pledge::schema::subscription_id_t& subscription_id);
  std::optional<pledge::schema::ed25519_public_key_t> public_key(
      const pledge::schema::subscription_id_t& subscription_id);

 private:
  pledge::storage::rocksdb_storage_t& storage_;
  enclave& enclave_;
  pledge::common::clock_t clock_;
  pledge::schema::encoding::scale_encoder_t encoder_;
  std::mutex mutex_;
};

}  // namespace pledge::vault
