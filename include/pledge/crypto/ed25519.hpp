#pragma once

#include <pledge/schema/primitives.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace pledge::crypto {

inline constexpr auto kEd25519Prefix = std::string_view{"ed25519:"};

using ed25519_seed_t = std::array<uint8_t, 32>;

/// Ed25519 signing key. Move-only; the seed is wiped when the key is
/// destroyed or moved from.
class secret_key final {
 public:
  secret_key(const secret_key&) = delete;
  secret_key& operator=(const secret_key&) = delete;
  secret_key(secret_key&& other) noexcept;
  secret_key& operator=(secret_key&& other) noexcept;
  ~secret_key();

  /// Fresh key from the OpenSSL CSPRNG. Returns std::nullopt if the RNG or
  /// key derivation fails.
  static std::optional<secret_key> generate();
  static std::optional<secret_key> from_seed(const ed25519_seed_t& seed);
  /// Parse `ed25519:<base58(seed || public_key)>`. The embedded public key
  /// must match the one derived from the seed.
  static std::optional<secret_key> try_parse(std::string_view text);

  const pledge::schema::ed25519_public_key_t& public_key() const {
    return public_key_;
  }
  const ed25519_seed_t& seed() const { return seed_; }

  std::optional<pledge::schema::ed25519_signature_t> sign(
      const pledge::schema::bytes_view_t& message) const;

  std::string to_string() const;

 private:
  secret_key(const ed25519_seed_t& seed,
             const pledge::schema::ed25519_public_key_t& public_key);
  void wipe() noexcept;

  ed25519_seed_t seed_{};
  pledge::schema::ed25519_public_key_t public_key_{};
};

/// `ed25519:<base58(public_key)>`
std::string to_string(const pledge::schema::ed25519_public_key_t& public_key);
std::optional<pledge::schema::ed25519_public_key_t> try_parse_public_key(
    std::string_view text);

}  // namespace pledge::crypto
