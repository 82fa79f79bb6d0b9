#pragma once

#include <pledge/ledger/ledger_client.hpp>
#include <pledge/schema/operation_result.hpp>
#include <pledge/schema/worker_status.hpp>
#include <pledge/vault/enclave.hpp>

#include <mutex>

namespace pledge::worker {

inline constexpr auto kWorkerCodespace = std::string_view{"pledge.worker"};
inline constexpr auto kWorkerAccountLabel =
    std::string_view{"pledge/worker-account"};

/// The service's own ledger identity, bound to the enclave image.
///
/// uninitialized -> derived -> registered_pending -> verified
///
/// One instance per process, constructed in main and passed by reference to
/// the components that must refuse to charge while unverified.
class worker_identity final {
 public:
  worker_identity(pledge::vault::enclave& enclave,
                  pledge::ledger::ledger_client& ledger);

  /// Derive the account from an enclave-held secret. Idempotent: the same
  /// enclave image always yields the same account.
  pledge::schema::value_result<pledge::schema::worker_status_t> derive();

  /// Submit the account and an attestation quote to the contract. Fails with
  /// `registration_failed` when the contract rejects the attestation.
  pledge::schema::value_result<pledge::schema::worker_status_t>
  register_worker();

  /// Query on-chain registration. "Not yet registered" is reported as
  /// `verified == false`, not as an error.
  pledge::schema::value_result<pledge::schema::worker_status_t> verify();

  pledge::schema::worker_status_t status();
  bool is_verified();

 private:
  pledge::schema::value_result<pledge::schema::worker_status_t> derive_locked();

  pledge::vault::enclave& enclave_;
  pledge::ledger::ledger_client& ledger_;
  pledge::schema::worker_status_t status_;
  std::mutex mutex_;
};

}  // namespace pledge::worker
