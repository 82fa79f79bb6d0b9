#include <gtest/gtest.h>
#include <pledge/crypto/ed25519.hpp>
#include <pledge/crypto/verify.hpp>
#include <pledge/schema/primitives.hpp>

#include <string>

namespace {

// RFC 8032 section 7.1, test 2.
constexpr auto kRfcSeed = std::string_view{
    "4ccd089b28ff96da9db6c346ec114e0f5b8a319f35aba624da8cf6ed4fb8a6fb"};
constexpr auto kRfcPublicKey = std::string_view{
    "3d4017c3e843895a92b70aa74d1b7ebc9c982ccf2ec4968cc0cd55f12af4660c"};
constexpr auto kRfcSignature = std::string_view{
    "92a009a9f0d4cab8720e820b5f642540a2b27b5416503f8fb3762223ebdb69da"
    "085ac1e43e15996e458f3613d0f11d8c387b2eaeb4302aeeb00d291612bb0c00"};

}  // namespace

TEST(crypto_ed25519, matches_rfc8032_vector) {
  if (!pledge::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto key = pledge::crypto::secret_key::from_seed(
      pledge::schema::make_hash32(kRfcSeed));
  ASSERT_TRUE(key.has_value());
  EXPECT_EQ(pledge::schema::to_hex(key->public_key()), kRfcPublicKey);

  auto message = pledge::schema::bytes_t{0x72};
  auto signature = key->sign(message);
  ASSERT_TRUE(signature.has_value());
  EXPECT_EQ(pledge::schema::to_hex(*signature), kRfcSignature);
  EXPECT_TRUE(pledge::crypto::verify_signature(message, key->public_key(),
                                               *signature));
}

TEST(crypto_ed25519, signatures_bind_message_and_key) {
  if (!pledge::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto key = pledge::crypto::secret_key::generate();
  auto other = pledge::crypto::secret_key::generate();
  ASSERT_TRUE(key.has_value());
  ASSERT_TRUE(other.has_value());
  EXPECT_NE(key->public_key(), other->public_key());

  auto message = pledge::schema::bytes_t{'p', 'l', 'e', 'd', 'g', 'e'};
  auto signature = key->sign(message);
  ASSERT_TRUE(signature.has_value());
  EXPECT_TRUE(pledge::crypto::verify_signature(message, key->public_key(),
                                               *signature));
  EXPECT_FALSE(pledge::crypto::verify_signature(message, other->public_key(),
                                                *signature));

  message[0] ^= 0x01;
  EXPECT_FALSE(pledge::crypto::verify_signature(message, key->public_key(),
                                                *signature));
}

TEST(crypto_ed25519, key_text_round_trips) {
  if (!pledge::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto key = pledge::crypto::secret_key::generate();
  ASSERT_TRUE(key.has_value());

  auto public_text = pledge::crypto::to_string(key->public_key());
  EXPECT_EQ(public_text.rfind("ed25519:", 0), 0u);
  auto public_key = pledge::crypto::try_parse_public_key(public_text);
  ASSERT_TRUE(public_key.has_value());
  EXPECT_EQ(*public_key, key->public_key());

  auto secret_text = key->to_string();
  auto parsed = pledge::crypto::secret_key::try_parse(secret_text);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->public_key(), key->public_key());
  EXPECT_EQ(parsed->seed(), key->seed());
}

TEST(crypto_ed25519, rejects_malformed_key_text) {
  if (!pledge::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto key = pledge::crypto::secret_key::generate();
  auto other = pledge::crypto::secret_key::generate();
  ASSERT_TRUE(key.has_value());
  ASSERT_TRUE(other.has_value());

  auto public_text = pledge::crypto::to_string(key->public_key());
  EXPECT_FALSE(pledge::crypto::try_parse_public_key(public_text.substr(8))
                   .has_value());
  EXPECT_FALSE(
      pledge::crypto::try_parse_public_key("secp256k1:" + public_text.substr(8))
          .has_value());
  EXPECT_FALSE(pledge::crypto::try_parse_public_key("ed25519:0OIl").has_value());
  EXPECT_FALSE(
      pledge::crypto::secret_key::try_parse(public_text).has_value());

  // Seed of one key with the public half of another.
  auto material = pledge::schema::bytes_t{key->seed().begin(), key->seed().end()};
  material.insert(material.end(), other->public_key().begin(),
                  other->public_key().end());
  auto mismatched =
      "ed25519:" + pledge::schema::encode_base58(material);
  EXPECT_FALSE(pledge::crypto::secret_key::try_parse(mismatched).has_value());
}

TEST(crypto_ed25519, moved_from_key_is_wiped) {
  if (!pledge::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto key = pledge::crypto::secret_key::generate();
  ASSERT_TRUE(key.has_value());
  auto seed = key->seed();

  auto moved = std::move(*key);
  EXPECT_EQ(moved.seed(), seed);
  EXPECT_EQ(key->seed(), pledge::crypto::ed25519_seed_t{});
}
