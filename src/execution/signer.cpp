#include <couponguard/crypto/base64url.hpp>
#include <couponguard/crypto/sign.hpp>
#include <couponguard/execution/signer.hpp>
#include <couponguard/token/coupon_token.hpp>
#include <couponguard/token/station_token.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <utility>

namespace couponguard::execution {

namespace {

inline constexpr std::string_view kCodeAlphabet{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789"};
inline constexpr auto kMinGeneratedCodeLength = size_t{6};
inline constexpr auto kMaxGeneratedCodeLength = size_t{20};
inline constexpr auto kCampaignPrefixLength = size_t{4};

// Rejection sampling keeps every alphabet character equally likely.
std::string random_alphanumeric(const size_t length) {
  constexpr auto kLimit = 256 - (256 % kCodeAlphabet.size());
  auto out = std::string{};
  out.reserve(length);
  while (out.size() < length) {
    for (auto byte : couponguard::crypto::random_bytes(length)) {
      if (byte >= kLimit) {
        continue;
      }
      out.push_back(kCodeAlphabet[byte % kCodeAlphabet.size()]);
      if (out.size() == length) {
        break;
      }
    }
  }
  return out;
}

uint32_t random_sequence() {
  auto bytes = couponguard::crypto::random_bytes(sizeof(uint32_t));
  auto value = uint32_t{};
  std::memcpy(&value, bytes.data(), sizeof(value));
  return value % couponguard::token::kSequenceModulus;
}

bool is_upper_alnum(const char c) {
  return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

}  // namespace

signer::signer(signing_key_provider_t keys, engine_options options)
    : keys_(std::move(keys)), options_(std::move(options)) {}

std::optional<couponguard::schema::signed_coupon_token_t>
signer::sign_coupon_token(
    const couponguard::schema::campaign_id_t campaign_id,
    std::string_view coupon_code,
    const couponguard::schema::timestamp_milliseconds_t issued_at) const {
  if (!couponguard::token::is_valid_coupon_code(coupon_code)) {
    spdlog::warn("Refusing to sign malformed coupon code '{}'", coupon_code);
    return std::nullopt;
  }
  auto issued_at_seconds = couponguard::token::truncate_to_seconds(issued_at);
  auto token = couponguard::token::format_token(couponguard::schema::coupon_token_t{
      .prefix = options_.token_prefix,
      .token_version = options_.token_version,
      .campaign_id = campaign_id,
      .sequence = random_sequence(),
      .issued_at = issued_at_seconds,
      .nonce = random_alphanumeric(couponguard::token::kNonceLength),
      .coupon_code = std::string{coupon_code}});

  auto signature =
      sign_token_fields(token, campaign_id, coupon_code, issued_at_seconds);
  if (!signature) {
    return std::nullopt;
  }
  spdlog::debug("Signed token for coupon code '{}' in campaign {}",
                coupon_code, campaign_id);
  return couponguard::schema::signed_coupon_token_t{
      .token = std::move(token),
      .signature = std::move(*signature),
      .issued_at = issued_at_seconds};
}

std::optional<std::string> signer::sign_token_fields(
    std::string_view token,
    const couponguard::schema::campaign_id_t campaign_id,
    std::string_view coupon_code,
    const couponguard::schema::timestamp_milliseconds_t issued_at) const {
  auto key = keys_ ? keys_(campaign_id) : std::nullopt;
  if (!key) {
    spdlog::error("No signing key provisioned for campaign {}", campaign_id);
    return std::nullopt;
  }
  auto message = couponguard::token::signed_message(token, campaign_id,
                                                    coupon_code, issued_at);
  auto signature =
      couponguard::crypto::sign(couponguard::schema::make_bytes_view(message), *key);
  if (!signature) {
    spdlog::error("Signing key for campaign {} was rejected", campaign_id);
    return std::nullopt;
  }
  return couponguard::crypto::base64url_encode(*signature);
}

std::optional<std::string> signer::sign_station_token(
    const couponguard::schema::station_id_t station_id,
    std::string_view dispenser_id,
    const couponguard::schema::timestamp_milliseconds_t issued_at,
    const couponguard::schema::timestamp_milliseconds_t expires_at,
    const couponguard::schema::ed25519_private_key_t& key) {
  if (dispenser_id.empty() || expires_at <= issued_at) {
    return std::nullopt;
  }
  auto claims = couponguard::schema::station_access_claims_t{
      .station_id = station_id,
      .dispenser_id = std::string{dispenser_id},
      .issued_at = issued_at,
      .expires_at = expires_at};
  auto nonce = couponguard::crypto::random_bytes(claims.nonce.size());
  std::copy(std::begin(nonce), std::end(nonce), std::begin(claims.nonce));

  auto payload_segment = couponguard::token::encode_station_claims(claims);
  auto signature = couponguard::crypto::sign(
      couponguard::schema::make_bytes_view(payload_segment),
      couponguard::schema::signing_key_t{key});
  if (!signature) {
    spdlog::error("Failed to sign station token for station {}", station_id);
    return std::nullopt;
  }
  return couponguard::token::join_station_token(payload_segment, *signature);
}

std::optional<std::string> generate_coupon_code(const size_t length,
                                                std::string_view prefix) {
  if (length < kMinGeneratedCodeLength || length > kMaxGeneratedCodeLength) {
    return std::nullopt;
  }
  if (prefix.empty()) {
    return random_alphanumeric(length);
  }
  if (!std::all_of(std::begin(prefix), std::end(prefix), is_upper_alnum) ||
      prefix.size() + 1 >= length) {
    return std::nullopt;
  }
  auto code = std::string{prefix};
  code.push_back('-');
  code.append(random_alphanumeric(length - prefix.size() - 1));
  return code;
}

std::string campaign_code_prefix(std::string_view campaign_name) {
  auto prefix = std::string{};
  for (auto c : campaign_name.substr(0, kCampaignPrefixLength)) {
    if (c >= 'a' && c <= 'z') {
      c = static_cast<char>(c - 'a' + 'A');
    }
    if (is_upper_alnum(c)) {
      prefix.push_back(c);
    }
  }
  return prefix;
}

}  // namespace couponguard::execution
