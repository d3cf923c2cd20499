#pragma once

#include <couponguard/schema/primitives.hpp>
#include <couponguard/schema/station_access_claims.hpp>

#include <optional>
#include <string>
#include <string_view>

// Station access token layout: base64url(SCALE(claims)) "." base64url(sig),
// where the signature covers the ASCII bytes of the first segment.
namespace couponguard::token {

struct station_token_parts_t final {
  std::string_view payload_segment;
  couponguard::schema::bytes_t signature;
  couponguard::schema::station_access_claims_t claims;
};

std::string encode_station_claims(
    const couponguard::schema::station_access_claims_t& claims);

std::string join_station_token(std::string_view payload_segment,
                               const couponguard::schema::bytes_view_t& signature);

/// Structural split and decode; no signature or expiry check. The returned
/// payload_segment views into `token`.
std::optional<station_token_parts_t> try_parse_station_token(
    std::string_view token);

}  // namespace couponguard::token
