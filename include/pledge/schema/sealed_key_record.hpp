#pragma once
#include <pledge/schema/primitives.hpp>

namespace pledge::schema {

template <uint16_t Version>
struct sealed_key_record;

/// Key custody record as it exists outside the enclave: the private seed is
/// present only as an enclave-sealed blob bound to the subscription id.
template <>
struct sealed_key_record<1> final {
  uint16_t version{1};
  subscription_id_t subscription_id;
  ed25519_public_key_t public_key{};
  bytes_t sealed_secret;
  timestamp_milliseconds_t stored_at{};
};

using sealed_key_record_t = sealed_key_record<1>;

}  // namespace pledge::schema
