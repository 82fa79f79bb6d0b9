#pragma once

#include <pledge/schema/primitives.hpp>

namespace pledge::crypto {

bool available();

bool verify_signature(const pledge::schema::bytes_view_t& message,
                      const pledge::schema::ed25519_public_key_t& public_key,
                      const pledge::schema::ed25519_signature_t& signature);

}  // namespace pledge::crypto
