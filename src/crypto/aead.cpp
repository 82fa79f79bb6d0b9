#include <pledge/crypto/aead.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <memory>

namespace pledge::crypto {

namespace {

using evp_cipher_ctx_ptr =
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

}  // namespace

std::optional<pledge::schema::bytes_t> random_bytes(size_t size) {
  auto out = pledge::schema::bytes_t(size);
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    return std::nullopt;
  }
  return out;
}

std::optional<pledge::schema::bytes_t> seal(
    const pledge::schema::hash32_t& key,
    const pledge::schema::bytes_view_t& plaintext,
    const pledge::schema::bytes_view_t& aad) {
  auto nonce = random_bytes(kAeadNonceSize);
  if (!nonce) {
    return std::nullopt;
  }

  auto ctx = evp_cipher_ctx_ptr{EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(kAeadNonceSize), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(),
                         nonce->data()) != 1) {
    return std::nullopt;
  }

  auto out = pledge::schema::bytes_t(kAeadNonceSize + plaintext.size() +
                                     kAeadTagSize);
  std::copy(nonce->begin(), nonce->end(), out.begin());

  auto length = 0;
  if (!aad.empty() &&
      EVP_EncryptUpdate(ctx.get(), nullptr, &length, aad.data(),
                        static_cast<int>(aad.size())) != 1) {
    return std::nullopt;
  }
  auto* cipher_out = out.data() + kAeadNonceSize;
  if (EVP_EncryptUpdate(ctx.get(), cipher_out, &length, plaintext.data(),
                        static_cast<int>(plaintext.size())) != 1) {
    return std::nullopt;
  }
  auto written = length;
  if (EVP_EncryptFinal_ex(ctx.get(), cipher_out + written, &length) != 1) {
    return std::nullopt;
  }
  written += length;
  if (static_cast<size_t>(written) != plaintext.size()) {
    return std::nullopt;
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                          static_cast<int>(kAeadTagSize),
                          cipher_out + written) != 1) {
    return std::nullopt;
  }
  return out;
}

std::optional<pledge::schema::bytes_t> open(
    const pledge::schema::hash32_t& key,
    const pledge::schema::bytes_view_t& sealed,
    const pledge::schema::bytes_view_t& aad) {
  if (sealed.size() < kAeadNonceSize + kAeadTagSize) {
    return std::nullopt;
  }
  auto nonce = sealed.first(kAeadNonceSize);
  auto ciphertext =
      sealed.subspan(kAeadNonceSize, sealed.size() - kAeadNonceSize -
                                         kAeadTagSize);
  auto tag = sealed.last(kAeadTagSize);

  auto ctx = evp_cipher_ctx_ptr{EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(kAeadNonceSize), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(),
                         nonce.data()) != 1) {
    return std::nullopt;
  }

  auto length = 0;
  if (!aad.empty() &&
      EVP_DecryptUpdate(ctx.get(), nullptr, &length, aad.data(),
                        static_cast<int>(aad.size())) != 1) {
    return std::nullopt;
  }
  auto plaintext = pledge::schema::bytes_t(ciphertext.size());
  if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &length,
                        ciphertext.data(),
                        static_cast<int>(ciphertext.size())) != 1) {
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    return std::nullopt;
  }
  auto written = length;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                          static_cast<int>(kAeadTagSize),
                          const_cast<uint8_t*>(tag.data())) != 1 ||
      EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + written, &length) !=
          1) {
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    return std::nullopt;
  }
  return plaintext;
}

}  // namespace pledge::crypto
