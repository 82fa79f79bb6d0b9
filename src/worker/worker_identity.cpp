#include <openssl/crypto.h>
#include <spdlog/spdlog.h>
#include <pledge/blake3/hash.hpp>
#include <pledge/crypto/ed25519.hpp>
#include <pledge/worker/worker_identity.hpp>

namespace pledge::worker {

namespace {

using pledge::schema::error_code;
using pledge::schema::worker_state_t;
using pledge::schema::worker_status_t;

pledge::schema::value_result<worker_status_t> worker_error(
    const error_code code,
    std::string log) {
  return pledge::schema::make_value_error<worker_status_t>(
      code, std::move(log), std::string{kWorkerCodespace});
}

}  // namespace

worker_identity::worker_identity(pledge::vault::enclave& enclave,
                                 pledge::ledger::ledger_client& ledger)
    : enclave_{enclave}, ledger_{ledger} {}

pledge::schema::value_result<worker_status_t> worker_identity::derive() {
  auto lock = std::scoped_lock{mutex_};
  return derive_locked();
}

pledge::schema::value_result<worker_status_t>
worker_identity::derive_locked() {
  if (status_.state != worker_state_t::uninitialized) {
    return pledge::schema::make_value(status_);
  }
  auto seed = enclave_.derive_secret(kWorkerAccountLabel);
  if (!seed) {
    spdlog::error("Enclave unavailable while deriving worker account");
    return worker_error(error_code::enclave_unavailable,
                        "enclave could not derive worker secret");
  }
  auto key = pledge::crypto::secret_key::from_seed(*seed);
  OPENSSL_cleanse(seed->data(), seed->size());
  if (!key) {
    return worker_error(error_code::enclave_unavailable,
                        "worker key derivation failed");
  }

  // Implicit account: the hex encoding of the account's public key.
  status_.account_id = pledge::schema::to_hex(key->public_key());
  status_.state = worker_state_t::derived;
  spdlog::info("Derived worker account {}", status_.account_id);
  return pledge::schema::make_value(status_);
}

pledge::schema::value_result<worker_status_t>
worker_identity::register_worker() {
  auto lock = std::scoped_lock{mutex_};
  auto derived = derive_locked();
  if (!derived.ok()) {
    return derived;
  }

  auto quote = enclave_.quote(pledge::blake3::hash(status_.account_id));
  if (!quote) {
    spdlog::error("Enclave unavailable while producing attestation quote");
    return worker_error(error_code::enclave_unavailable,
                        "enclave could not produce a quote");
  }

  auto result = ledger_.register_worker(status_.account_id, *quote,
                                        enclave_.measurement());
  if (!result.ok()) {
    spdlog::error("Worker registration failed: {}", result.log);
    return worker_error(result.code, result.log);
  }

  status_.attestation_quote = std::move(*quote);
  if (status_.state == worker_state_t::derived) {
    status_.state = worker_state_t::registered_pending;
  }
  spdlog::info("Registered worker account {}", status_.account_id);
  return pledge::schema::make_value(status_);
}

pledge::schema::value_result<worker_status_t> worker_identity::verify() {
  auto lock = std::scoped_lock{mutex_};
  auto derived = derive_locked();
  if (!derived.ok()) {
    return derived;
  }

  auto verified = ledger_.is_worker_verified(status_.account_id);
  if (!verified) {
    spdlog::warn("Could not query worker verification for {}",
                 status_.account_id);
    return worker_error(error_code::ledger_rejected,
                        "ledger could not be queried");
  }

  status_.verified = *verified;
  if (*verified) {
    if (status_.state != worker_state_t::verified) {
      spdlog::info("Worker account {} verified", status_.account_id);
    }
    status_.state = worker_state_t::verified;
  } else if (status_.state == worker_state_t::verified) {
    spdlog::warn("Worker account {} is no longer verified",
                 status_.account_id);
    status_.state = worker_state_t::registered_pending;
  }
  return pledge::schema::make_value(status_);
}

worker_status_t worker_identity::status() {
  auto lock = std::scoped_lock{mutex_};
  return status_;
}

bool worker_identity::is_verified() {
  auto lock = std::scoped_lock{mutex_};
  return status_.verified;
}

}  // namespace pledge::worker
