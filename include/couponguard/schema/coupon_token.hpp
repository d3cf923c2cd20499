#pragma once
#include <couponguard/schema/primitives.hpp>

#include <string>

namespace couponguard::schema {

/// Parsed segments of a coupon token:
/// PREFIX_VERSION_CAMPAIGN_SEQUENCE_ISSUED_NONCE_CODE
struct coupon_token_t final {
  std::string prefix;
  std::string token_version;
  campaign_id_t campaign_id{};
  uint32_t sequence{};
  timestamp_milliseconds_t issued_at{};
  std::string nonce;
  std::string coupon_code;
};

/// Token plus its detached signature (base64url, unpadded).
struct signed_coupon_token_t final {
  std::string token;
  std::string signature;
  // Issuance time as embedded and signed, truncated to whole seconds. Store
  // this on the coupon record, not the caller's original timestamp.
  timestamp_milliseconds_t issued_at{};
};

}  // namespace couponguard::schema
