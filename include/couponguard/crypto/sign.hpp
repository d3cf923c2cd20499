#pragma once

#include <couponguard/schema/primitives.hpp>
#include <couponguard/schema/signing_key.hpp>

#include <optional>

namespace couponguard::crypto {

/// HMAC-SHA256 for hmac_secret_t, Ed25519 for ed25519_private_key_t.
/// std::nullopt when the key is unusable (empty secret, OpenSSL refusal).
std::optional<couponguard::schema::bytes_t> sign(
    const couponguard::schema::bytes_view_t& message,
    const couponguard::schema::signing_key_t& key);

std::optional<couponguard::schema::bytes_t> hmac_sha256(
    const couponguard::schema::bytes_view_t& secret,
    const couponguard::schema::bytes_view_t& message);

std::optional<couponguard::schema::ed25519_public_key_t> public_key_of(
    const couponguard::schema::ed25519_private_key_t& key);

/// Verification half of a signing key: the secret itself for HMAC, the
/// derived public key for Ed25519.
std::optional<couponguard::schema::verification_key_t> verification_key_of(
    const couponguard::schema::signing_key_t& key);

couponguard::schema::ed25519_private_key_t generate_ed25519_key();

/// CSPRNG bytes; terminates through critical() if the generator fails.
couponguard::schema::bytes_t random_bytes(size_t size);

}  // namespace couponguard::crypto
