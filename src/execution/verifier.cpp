#include <couponguard/crypto/base64url.hpp>
#include <couponguard/crypto/verify.hpp>
#include <couponguard/execution/verifier.hpp>
#include <couponguard/token/coupon_token.hpp>
#include <couponguard/token/station_token.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace couponguard::execution {

verifier::verifier(verification_key_provider_t keys, engine_options options)
    : keys_(std::move(keys)), options_(std::move(options)) {}

bool verifier::is_well_formed(std::string_view token) const {
  return couponguard::token::is_well_formed(token, options_.token_prefix,
                                            options_.token_version);
}

bool verifier::verify_signature(
    std::string_view token,
    std::string_view signature,
    const couponguard::schema::coupon_state_t& coupon) const {
  if (signature.empty()) {
    spdlog::warn("Coupon {} presented without a signature", coupon.coupon_id);
    return false;
  }
  auto signature_bytes = couponguard::crypto::try_base64url_decode(signature);
  if (!signature_bytes || signature_bytes->empty()) {
    return false;
  }
  auto key = keys_ ? keys_(coupon.campaign_id) : std::nullopt;
  if (!key) {
    spdlog::error("No verification key provisioned for campaign {}",
                  coupon.campaign_id);
    return false;
  }
  auto message = couponguard::token::signed_message(
      token, coupon.campaign_id, coupon.coupon_code, coupon.issued_at);
  return couponguard::crypto::verify_signature(
      couponguard::schema::make_bytes_view(message), *key, *signature_bytes);
}

bool verifier::is_stale_by_timestamp(
    std::string_view token,
    const couponguard::schema::duration_milliseconds_t max_age,
    const couponguard::schema::timestamp_milliseconds_t now) const {
  auto parsed = couponguard::token::try_parse(token, options_.token_prefix,
                                              options_.token_version);
  if (!parsed) {
    return true;
  }
  if (parsed->issued_at >= now) {
    return false;
  }
  return now - parsed->issued_at > max_age;
}

bool verifier::is_stale_by_timestamp(
    std::string_view token,
    const couponguard::schema::timestamp_milliseconds_t now) const {
  return is_stale_by_timestamp(token, options_.max_token_age, now);
}

couponguard::schema::station_token_verification_t
verifier::verify_station_token(
    std::string_view token,
    const couponguard::schema::ed25519_public_key_t& key,
    const couponguard::schema::timestamp_milliseconds_t now) {
  auto result = couponguard::schema::station_token_verification_t{};
  auto parts = couponguard::token::try_parse_station_token(token);
  if (!parts) {
    result.status = couponguard::schema::station_token_status_t::malformed;
    return result;
  }
  if (!couponguard::crypto::verify_signature(
          couponguard::schema::make_bytes_view(parts->payload_segment),
          couponguard::schema::verification_key_t{key}, parts->signature)) {
    spdlog::warn("Station token signature rejected");
    result.status =
        couponguard::schema::station_token_status_t::signature_invalid;
    return result;
  }
  result.claims = parts->claims;
  if (now >= parts->claims.expires_at) {
    result.status = couponguard::schema::station_token_status_t::expired;
    return result;
  }
  result.status = couponguard::schema::station_token_status_t::valid;
  return result;
}

}  // namespace couponguard::execution
