#pragma once

#include <pledge/schema/primitives.hpp>

#include <optional>

namespace pledge::crypto {

inline constexpr auto kAeadNonceSize = size_t{12};
inline constexpr auto kAeadTagSize = size_t{16};

/// AES-256-GCM. Output layout is nonce || ciphertext || tag.
std::optional<pledge::schema::bytes_t> seal(
    const pledge::schema::hash32_t& key,
    const pledge::schema::bytes_view_t& plaintext,
    const pledge::schema::bytes_view_t& aad);

/// Reverse of seal. Returns std::nullopt on any authentication failure.
std::optional<pledge::schema::bytes_t> open(
    const pledge::schema::hash32_t& key,
    const pledge::schema::bytes_view_t& sealed,
    const pledge::schema::bytes_view_t& aad);

std::optional<pledge::schema::bytes_t> random_bytes(size_t size);

}  // namespace pledge::crypto
