#include <pledge/crypto/ed25519.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <memory>

namespace pledge::crypto {

namespace {

using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

evp_pkey_ptr make_private_pkey(const ed25519_seed_t& seed) {
  return evp_pkey_ptr{EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                   seed.data(), seed.size()),
                      EVP_PKEY_free};
}

}  // namespace

secret_key::secret_key(const ed25519_seed_t& seed,
                       const pledge::schema::ed25519_public_key_t& public_key)
    : seed_{seed}, public_key_{public_key} {}

secret_key::secret_key(secret_key&& other) noexcept
    : seed_{other.seed_}, public_key_{other.public_key_} {
  other.wipe();
}

secret_key& secret_key::operator=(secret_key&& other) noexcept {
  if (this != &other) {
    seed_ = other.seed_;
    public_key_ = other.public_key_;
    other.wipe();
  }
  return *this;
}

secret_key::~secret_key() { wipe(); }

void secret_key::wipe() noexcept {
  OPENSSL_cleanse(seed_.data(), seed_.size());
}

std::optional<secret_key> secret_key::generate() {
  auto seed = ed25519_seed_t{};
  if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
    return std::nullopt;
  }
  auto key = from_seed(seed);
  OPENSSL_cleanse(seed.data(), seed.size());
  return key;
}

std::optional<secret_key> secret_key::from_seed(const ed25519_seed_t& seed) {
  auto pkey = make_private_pkey(seed);
  if (!pkey) {
    return std::nullopt;
  }
  auto public_key = pledge::schema::ed25519_public_key_t{};
  auto length = public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), public_key.data(), &length) !=
          1 ||
      length != public_key.size()) {
    return std::nullopt;
  }
  return secret_key{seed, public_key};
}

std::optional<secret_key> secret_key::try_parse(std::string_view text) {
  if (!text.starts_with(kEd25519Prefix)) {
    return std::nullopt;
  }
  text.remove_prefix(kEd25519Prefix.size());
  auto decoded = pledge::schema::try_decode_base58(text);
  if (!decoded || decoded->size() != 64) {
    return std::nullopt;
  }
  auto seed = ed25519_seed_t{};
  std::copy_n(decoded->begin(), seed.size(), seed.begin());
  auto key = from_seed(seed);
  OPENSSL_cleanse(seed.data(), seed.size());
  auto embedded_public_matches =
      key && std::equal(key->public_key().begin(), key->public_key().end(),
                        decoded->begin() + 32);
  OPENSSL_cleanse(decoded->data(), decoded->size());
  if (!embedded_public_matches) {
    return std::nullopt;
  }
  return key;
}

std::optional<pledge::schema::ed25519_signature_t> secret_key::sign(
    const pledge::schema::bytes_view_t& message) const {
  auto pkey = make_private_pkey(seed_);
  if (!pkey) {
    return std::nullopt;
  }
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
      1) {
    return std::nullopt;
  }
  auto signature = pledge::schema::ed25519_signature_t{};
  auto length = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(),
                     message.size()) != 1 ||
      length != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

std::string secret_key::to_string() const {
  auto material = pledge::schema::bytes_t{};
  material.reserve(seed_.size() + public_key_.size());
  material.insert(material.end(), seed_.begin(), seed_.end());
  material.insert(material.end(), public_key_.begin(), public_key_.end());
  auto text = std::string{kEd25519Prefix} +
              pledge::schema::encode_base58(material);
  OPENSSL_cleanse(material.data(), material.size());
  return text;
}

std::string to_string(const pledge::schema::ed25519_public_key_t& public_key) {
  return std::string{kEd25519Prefix} +
         pledge::schema::encode_base58(public_key);
}

std::optional<pledge::schema::ed25519_public_key_t> try_parse_public_key(
    std::string_view text) {
  if (!text.starts_with(kEd25519Prefix)) {
    return std::nullopt;
  }
  text.remove_prefix(kEd25519Prefix.size());
  auto decoded = pledge::schema::try_decode_base58(text);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto public_key = pledge::schema::ed25519_public_key_t{};
  std::copy(decoded->begin(), decoded->end(), public_key.begin());
  return public_key;
}

}  // namespace pledge::crypto
