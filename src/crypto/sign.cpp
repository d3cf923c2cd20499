#include <couponguard/common/critical.hpp>
#include <couponguard/crypto/sign.hpp>

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <openssl/rand.h>

#include <array>
#include <memory>

namespace couponguard::crypto {

namespace {

using evp_mac_ptr = std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)>;
using evp_mac_ctx_ptr =
    std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

inline constexpr auto kEd25519SignatureSize = size_t{64};

evp_pkey_ptr make_ed25519_private(
    const couponguard::schema::ed25519_private_key_t& key) {
  return evp_pkey_ptr{EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                   key.seed.data(),
                                                   key.seed.size()),
                      EVP_PKEY_free};
}

std::optional<couponguard::schema::bytes_t> sign_ed25519(
    const couponguard::schema::bytes_view_t& message,
    const couponguard::schema::ed25519_private_key_t& key) {
  auto pkey = make_ed25519_private(key);
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
  auto signature = couponguard::schema::bytes_t(kEd25519SignatureSize);
  auto signature_size = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &signature_size,
                     message.data(), message.size()) != 1) {
    return std::nullopt;
  }
  signature.resize(signature_size);
  return signature;
}

}  // namespace

std::optional<couponguard::schema::bytes_t> hmac_sha256(
    const couponguard::schema::bytes_view_t& secret,
    const couponguard::schema::bytes_view_t& message) {
  if (secret.empty()) {
    return std::nullopt;
  }
  auto mac =
      evp_mac_ptr{EVP_MAC_fetch(nullptr, OSSL_MAC_NAME_HMAC, nullptr),
                  EVP_MAC_free};
  if (!mac) {
    return std::nullopt;
  }
  auto ctx = evp_mac_ctx_ptr{EVP_MAC_CTX_new(mac.get()), EVP_MAC_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }

  auto* digest_name = const_cast<char*>("SHA256");
  auto params = std::array{OSSL_PARAM_construct_utf8_string(
                               OSSL_MAC_PARAM_DIGEST, digest_name, 0),
                           OSSL_PARAM_construct_end()};
  if (EVP_MAC_init(ctx.get(), secret.data(), secret.size(), params.data()) !=
      1) {
    return std::nullopt;
  }
  if (EVP_MAC_update(ctx.get(), message.data(), message.size()) != 1) {
    return std::nullopt;
  }
  auto out = couponguard::schema::bytes_t(EVP_MAX_MD_SIZE);
  auto out_size = size_t{};
  if (EVP_MAC_final(ctx.get(), out.data(), &out_size, out.size()) != 1) {
    return std::nullopt;
  }
  out.resize(out_size);
  return out;
}

std::optional<couponguard::schema::bytes_t> sign(
    const couponguard::schema::bytes_view_t& message,
    const couponguard::schema::signing_key_t& key) {
  return std::visit(
      overloaded{[&](const couponguard::schema::hmac_secret_t& value) {
                   return hmac_sha256(value.secret, message);
                 },
                 [&](const couponguard::schema::ed25519_private_key_t& value) {
                   return sign_ed25519(message, value);
                 }},
      key);
}

std::optional<couponguard::schema::ed25519_public_key_t> public_key_of(
    const couponguard::schema::ed25519_private_key_t& key) {
  auto pkey = make_ed25519_private(key);
  if (!pkey) {
    return std::nullopt;
  }
  auto public_key = couponguard::schema::ed25519_public_key_t{};
  auto size = public_key.public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), public_key.public_key.data(),
                                  &size) != 1 ||
      size != public_key.public_key.size()) {
    return std::nullopt;
  }
  return public_key;
}

std::optional<couponguard::schema::verification_key_t> verification_key_of(
    const couponguard::schema::signing_key_t& key) {
  auto result = std::optional<couponguard::schema::verification_key_t>{};
  std::visit(
      overloaded{[&](const couponguard::schema::hmac_secret_t& value) {
                   result = value;
                 },
                 [&](const couponguard::schema::ed25519_private_key_t& value) {
                   auto public_key = public_key_of(value);
                   if (public_key) {
                     result = *public_key;
                   }
                 }},
      key);
  return result;
}

couponguard::schema::ed25519_private_key_t generate_ed25519_key() {
  auto key = couponguard::schema::ed25519_private_key_t{};
  auto seed = random_bytes(key.seed.size());
  std::copy(std::begin(seed), std::end(seed), std::begin(key.seed));
  return key;
}

couponguard::schema::bytes_t random_bytes(const size_t size) {
  auto out = couponguard::schema::bytes_t(size);
  if (size > 0 && RAND_bytes(out.data(), static_cast<int>(size)) != 1) {
    couponguard::common::critical("OpenSSL random generator failed");
  }
  return out;
}

}  // namespace couponguard::crypto
