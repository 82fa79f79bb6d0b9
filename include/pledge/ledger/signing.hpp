#pragma once

#include <pledge/blake3/hash.hpp>
#include <pledge/schema/transaction.hpp>

namespace pledge::ledger {

/// Bytes an account key signs for `transaction`: the BLAKE3 digest of its
/// SCALE encoding.
template <typename Encoder>
pledge::schema::hash32_t make_signing_payload(
    Encoder& encoder,
    const pledge::schema::transaction_t& transaction) {
  return pledge::blake3::hash(encoder.encode(transaction));
}

/// Transaction hash reported by the ledger for a signed transaction.
template <typename Encoder>
pledge::schema::hash32_t make_transaction_hash(
    Encoder& encoder,
    const pledge::schema::signed_transaction_t& transaction) {
  return pledge::blake3::hash(encoder.encode(transaction));
}

}  // namespace pledge::ledger
