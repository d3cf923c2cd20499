#pragma once

#include <couponguard/schema/coupon_token.hpp>
#include <couponguard/schema/primitives.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

// Coupon token layout:
//   PREFIX_VERSION_CAMPAIGN_SEQUENCE_ISSUED_NONCE_CODE
//   GSL_v1_000042_00031337_20250101093000_K3Q9Z0AB_SUMMER-2025
// CAMPAIGN is zero padded to at least six digits, SEQUENCE is eight digits,
// ISSUED is UTC yyyyMMddHHmmss, NONCE is eight of [A-Z0-9] and CODE is six to
// fifty of [A-Z0-9-]. No segment may contain '_'.
namespace couponguard::token {

inline constexpr std::string_view kDefaultPrefix{"GSL"};
inline constexpr std::string_view kDefaultVersion{"v1"};
inline constexpr auto kSegmentCount = size_t{7};
inline constexpr auto kMinCampaignDigits = size_t{6};
inline constexpr auto kMaxCampaignDigits = size_t{20};
inline constexpr auto kSequenceDigits = size_t{8};
inline constexpr auto kSequenceModulus = uint32_t{100'000'000};
inline constexpr auto kTimestampDigits = size_t{14};
inline constexpr auto kNonceLength = size_t{8};
inline constexpr auto kMinCodeLength = size_t{6};
inline constexpr auto kMaxCodeLength = size_t{50};

std::string format_token(const couponguard::schema::coupon_token_t& token);

std::optional<couponguard::schema::coupon_token_t> try_parse(
    std::string_view token,
    std::string_view prefix = kDefaultPrefix,
    std::string_view version = kDefaultVersion);

bool is_well_formed(std::string_view token,
                    std::string_view prefix = kDefaultPrefix,
                    std::string_view version = kDefaultVersion);

bool is_valid_coupon_code(std::string_view coupon_code);

/// Whole-second UTC rendering, yyyyMMddHHmmss.
std::string format_utc_timestamp(
    couponguard::schema::timestamp_milliseconds_t timestamp);

std::optional<couponguard::schema::timestamp_milliseconds_t>
try_parse_utc_timestamp(std::string_view text);

couponguard::schema::timestamp_milliseconds_t truncate_to_seconds(
    couponguard::schema::timestamp_milliseconds_t timestamp);

/// Bytes covered by a coupon signature: the token bound to the record's
/// immutable issuance fields.
std::string signed_message(std::string_view token,
                           couponguard::schema::campaign_id_t campaign_id,
                           std::string_view coupon_code,
                           couponguard::schema::timestamp_milliseconds_t issued_at);

}  // namespace couponguard::token
