#pragma once
#include <couponguard/schema/primitives.hpp>

#include <array>
#include <variant>

namespace couponguard::schema {

struct hmac_secret_t final {
  bytes_t secret;
};

struct ed25519_private_key_t final {
  std::array<uint8_t, 32> seed;
};

struct ed25519_public_key_t final {
  std::array<uint8_t, 32> public_key;
};

using signing_key_t = std::variant<hmac_secret_t, ed25519_private_key_t>;
using verification_key_t = std::variant<hmac_secret_t, ed25519_public_key_t>;

}  // namespace couponguard::schema
