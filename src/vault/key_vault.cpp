#include <openssl/crypto.h>
#include <spdlog/spdlog.h>
#include <pledge/crypto/verify.hpp>
#include <pledge/schema/key/keys.hpp>
#include <pledge/schema/sealed_key_record.hpp>
#include <pledge/vault/key_vault.hpp>

#include <algorithm>

namespace pledge::vault {

namespace {

using pledge::schema::error_code;

// Binds a sealed blob to its subscription and public key so records cannot
// be swapped between subscriptions on disk.
pledge::schema::bytes_t make_aad(
    const pledge::schema::subscription_id_t& subscription_id,
    const pledge::schema::ed25519_public_key_t& public_key) {
  auto aad = pledge::schema::make_bytes(subscription_id);
  aad.insert(aad.end(), public_key.begin(), public_key.end());
  return aad;
}

}  // namespace

signer::signer(key_vault& vault,
               pledge::schema::subscription_id_t subscription_id,
               const pledge::schema::ed25519_public_key_t& public_key)
    : vault_{&vault},
      subscription_id_{std::move(subscription_id)},
      public_key_{public_key} {}

pledge::schema::value_result<pledge::schema::ed25519_signature_t> signer::sign(
    const pledge::schema::bytes_view_t& payload) const {
  return vault_->sign(subscription_id_, payload);
}

key_vault::key_vault(pledge::storage::rocksdb_storage_t& storage,
                     enclave& enclave,
                     pledge::common::clock_t clock)
    : storage_{storage}, enclave_{enclave}, clock_{std::move(clock)} {}

pledge::schema::operation_result_t key_vault::store(
    const pledge::schema::subscription_id_t& subscription_id,
    pledge::crypto::secret_key&& key,
    const pledge::schema::ed25519_public_key_t& public_key) {
  auto custody = std::move(key);
  if (subscription_id.empty()) {
    return pledge::schema::make_error(error_code::invalid_parameters,
                                      "subscription id is required",
                                      std::string{kVaultCodespace});
  }
  if (custody.public_key() != public_key) {
    spdlog::warn("Rejected key for {}: public key does not match private key",
                 subscription_id);
    return pledge::schema::make_error(
        error_code::invalid_parameters,
        "public key does not match private key",
        std::string{kVaultCodespace});
  }

  auto lock = std::scoped_lock{mutex_};
  auto key_bytes =
      pledge::schema::key::make_sealed_key_key(encoder_, subscription_id);
  if (storage_.get<pledge::schema::sealed_key_record_t>(encoder_, key_bytes)) {
    spdlog::warn("Key for {} is already in custody", subscription_id);
    return pledge::schema::make_error(error_code::already_stored,
                                      "key already stored for subscription",
                                      std::string{kVaultCodespace});
  }

  auto aad = make_aad(subscription_id, public_key);
  auto sealed = enclave_.seal(custody.seed(), aad);
  if (!sealed) {
    spdlog::error("Enclave failed to seal key for {}", subscription_id);
    return pledge::schema::make_error(error_code::enclave_unavailable,
                                      "enclave could not seal key",
                                      std::string{kVaultCodespace});
  }

  storage_.put(encoder_, key_bytes,
               pledge::schema::sealed_key_record_t{
                   .subscription_id = subscription_id,
                   .public_key = public_key,
                   .sealed_secret = std::move(*sealed),
                   .stored_at = clock_()});
  spdlog::info("Stored key {} for subscription {}",
               pledge::crypto::to_string(public_key), subscription_id);
  return pledge::schema::make_ok("key stored");
}

pledge::schema::value_result<pledge::schema::ed25519_signature_t>
key_vault::sign(const pledge::schema::subscription_id_t& subscription_id,
                const pledge::schema::bytes_view_t& payload) {
  using result_t = pledge::schema::ed25519_signature_t;

  auto lock = std::scoped_lock{mutex_};
  auto record = storage_.get<pledge::schema::sealed_key_record_t>(
      encoder_,
      pledge::schema::key::make_sealed_key_key(encoder_, subscription_id));
  if (!record) {
    return pledge::schema::make_value_error<result_t>(
        error_code::not_found, "no key in custody for subscription",
        std::string{kVaultCodespace});
  }

  auto seed_bytes = enclave_.unseal(
      record->sealed_secret, make_aad(subscription_id, record->public_key));
  if (!seed_bytes || seed_bytes->size() != pledge::crypto::ed25519_seed_t{}.size()) {
    spdlog::error("Enclave failed to unseal key for {}", subscription_id);
    if (seed_bytes) {
      OPENSSL_cleanse(seed_bytes->data(), seed_bytes->size());
    }
    return pledge::schema::make_value_error<result_t>(
        error_code::enclave_unavailable, "enclave could not unseal key",
        std::string{kVaultCodespace});
  }
  auto seed = pledge::crypto::ed25519_seed_t{};
  std::copy(seed_bytes->begin(), seed_bytes->end(), seed.begin());
  OPENSSL_cleanse(seed_bytes->data(), seed_bytes->size());

  auto key = pledge::crypto::secret_key::from_seed(seed);
  OPENSSL_cleanse(seed.data(), seed.size());
  if (!key || key->public_key() != record->public_key) {
    spdlog::error("Unsealed key for {} does not match its public key",
                  subscription_id);
    return pledge::schema::make_value_error<result_t>(
        error_code::enclave_unavailable, "sealed key is unusable",
        std::string{kVaultCodespace});
  }

  auto signature = key->sign(payload);
  if (!signature) {
    return pledge::schema::make_value_error<result_t>(
        error_code::enclave_unavailable, "signing failed",
        std::string{kVaultCodespace});
  }
  return pledge::schema::make_value(*signature);
}

std::optional<signer> key_vault::signer_for(
    const pledge::schema::subscription_id_t& subscription_id) {
  auto key = public_key(subscription_id);
  if (!key) {
    return std::nullopt;
  }
  return signer{*this, subscription_id, *key};
}

bool key_vault::destroy(
    const pledge::schema::subscription_id_t& subscription_id) {
  auto lock = std::scoped_lock{mutex_};
  auto erased = storage_.erase(
      pledge::schema::key::make_sealed_key_key(encoder_, subscription_id));
  if (erased) {
    spdlog::info("Destroyed key for subscription {}", subscription_id);
  }
  return erased;
}

bool key_vault::contains(
    const pledge::schema::subscription_id_t& subscription_id) {
  return public_key(subscription_id).has_value();
}

std::optional<pledge::schema::ed25519_public_key_t> key_vault::public_key(
    const pledge::schema::subscription_id_t& subscription_id) {
  auto lock = std::scoped_lock{mutex_};
  auto record = storage_.get<pledge::schema::sealed_key_record_t>(
      encoder_,
      pledge::schema::key::make_sealed_key_key(encoder_, subscription_id));
  if (!record) {
    return std::nullopt;
  }
  return record->public_key;
}

}  // namespace pledge::vault
