#pragma once

#include <couponguard/crypto/sign.hpp>
#include <couponguard/schema/primitives.hpp>
#include <couponguard/schema/signing_key.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace couponguard::testing {

// 2025-01-15 12:00:00 UTC
inline constexpr auto kBaseTime =
    couponguard::schema::timestamp_milliseconds_t{1'736'942'400'000};

inline constexpr auto kDay = couponguard::schema::kMillisecondsPerDay;
inline constexpr auto kHour = couponguard::schema::kMillisecondsPerHour;

inline couponguard::schema::hmac_secret_t make_hmac_key(const uint8_t seed) {
  auto key = couponguard::schema::hmac_secret_t{};
  key.secret.resize(32);
  for (std::size_t i = 0; i < key.secret.size(); ++i) {
    key.secret[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return key;
}

inline couponguard::schema::ed25519_private_key_t make_ed25519_key(
    const uint8_t seed) {
  auto key = couponguard::schema::ed25519_private_key_t{};
  for (std::size_t i = 0; i < key.seed.size(); ++i) {
    key.seed[i] = static_cast<uint8_t>(seed * 7 + static_cast<uint8_t>(i));
  }
  return key;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace couponguard::testing
