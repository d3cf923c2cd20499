#include <couponguard/crypto/sign.hpp>
#include <couponguard/crypto/verify.hpp>

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <memory>

namespace couponguard::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using evp_mac_ptr = std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)>;

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx) {
    return false;
  }
  return true;
}

bool openssl_has_hmac() {
  auto mac = evp_mac_ptr{EVP_MAC_fetch(nullptr, OSSL_MAC_NAME_HMAC, nullptr),
                         EVP_MAC_free};
  if (!mac) {
    return false;
  }
  return true;
}

bool verify_ed25519(const couponguard::schema::bytes_view_t& message,
                    const couponguard::schema::ed25519_public_key_t& key,
                    const couponguard::schema::bytes_view_t& signature) {
  auto pkey = evp_pkey_ptr{EVP_PKEY_new_raw_public_key(
                               EVP_PKEY_ED25519, nullptr,
                               key.public_key.data(), key.public_key.size()),
                           EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

bool verify_hmac(const couponguard::schema::bytes_view_t& message,
                 const couponguard::schema::hmac_secret_t& key,
                 const couponguard::schema::bytes_view_t& signature) {
  auto expected = hmac_sha256(key.secret, message);
  if (!expected) {
    return false;
  }
  return constant_time_equals(*expected, signature);
}

}  // namespace

bool available() {
  static const auto available_now = openssl_has_ed25519() && openssl_has_hmac();
  return available_now;
}

bool constant_time_equals(const couponguard::schema::bytes_view_t& lhs,
                          const couponguard::schema::bytes_view_t& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  if (lhs.empty()) {
    return true;
  }
  return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

bool verify_signature(const couponguard::schema::bytes_view_t& message,
                      const couponguard::schema::verification_key_t& key,
                      const couponguard::schema::bytes_view_t& signature) {
  if (signature.empty()) {
    return false;
  }
  auto verified = false;
  std::visit(
      overloaded{[&](const couponguard::schema::hmac_secret_t& value) {
                   verified = verify_hmac(message, value, signature);
                 },
                 [&](const couponguard::schema::ed25519_public_key_t& value) {
                   verified = verify_ed25519(message, value, signature);
                 }},
      key);
  return verified;
}

}  // namespace couponguard::crypto
