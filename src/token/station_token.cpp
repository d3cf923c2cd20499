#include <couponguard/crypto/base64url.hpp>
#include <couponguard/schema/encoding/scale/encoder.hpp>
#include <couponguard/token/station_token.hpp>

namespace couponguard::token {

namespace {

using encoder_t = couponguard::schema::encoding::encoder<
    couponguard::schema::encoding::scale_encoder_tag>;

}  // namespace

std::string encode_station_claims(
    const couponguard::schema::station_access_claims_t& claims) {
  auto encoded = encoder_t{}.encode(claims);
  return couponguard::crypto::base64url_encode(encoded);
}

std::string join_station_token(
    std::string_view payload_segment,
    const couponguard::schema::bytes_view_t& signature) {
  auto token = std::string{payload_segment};
  token.push_back('.');
  token.append(couponguard::crypto::base64url_encode(signature));
  return token;
}

std::optional<station_token_parts_t> try_parse_station_token(
    std::string_view token) {
  auto separator = token.find('.');
  if (separator == std::string_view::npos ||
      token.find('.', separator + 1) != std::string_view::npos) {
    return std::nullopt;
  }
  auto payload_segment = token.substr(0, separator);
  auto signature_segment = token.substr(separator + 1);
  if (payload_segment.empty() || signature_segment.empty()) {
    return std::nullopt;
  }

  auto payload = couponguard::crypto::try_base64url_decode(payload_segment);
  auto signature = couponguard::crypto::try_base64url_decode(signature_segment);
  if (!payload || !signature) {
    return std::nullopt;
  }
  auto claims =
      encoder_t{}.try_decode<couponguard::schema::station_access_claims_t>(
          *payload);
  if (!claims || claims->version != 1) {
    return std::nullopt;
  }
  return station_token_parts_t{.payload_segment = payload_segment,
                               .signature = std::move(*signature),
                               .claims = std::move(*claims)};
}

}  // namespace couponguard::token
