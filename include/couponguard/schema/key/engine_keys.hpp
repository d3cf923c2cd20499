#pragma once

#include <couponguard/schema/primitives.hpp>

#include <array>
#include <string_view>

// Schema key type: engine keys.
// Coupon workflow: canonical key prefixes for coupon and campaign state, the
// lookup indexes pointing at coupon ids, and the id sequence.
namespace couponguard::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kCouponKeyPrefix{"SYS|STATE|COUPON|"};
inline constexpr std::string_view kCampaignKeyPrefix{"SYS|STATE|CAMPAIGN|"};
inline constexpr std::string_view kIndexPrefix{"SYS|INDEX|"};
inline constexpr std::string_view kTokenIndexPrefix{"SYS|INDEX|TOKEN|"};
inline constexpr std::string_view kCodeIndexPrefix{"SYS|INDEX|CODE|"};
inline constexpr std::string_view kCouponSequenceKey{"SYS|SEQ|COUPON"};

inline const std::array<std::string_view, 7> kEngineKeyspaces{
    kStatePrefix,      kCouponKeyPrefix, kCampaignKeyPrefix,
    kIndexPrefix,      kTokenIndexPrefix, kCodeIndexPrefix,
    kCouponSequenceKey};

couponguard::schema::bytes_t make_prefixed_key(
    std::string_view prefix,
    const couponguard::schema::bytes_view_t& id);

couponguard::schema::bytes_t make_coupon_key(
    couponguard::schema::coupon_id_t coupon_id);

couponguard::schema::bytes_t make_campaign_key(
    couponguard::schema::campaign_id_t campaign_id);

/// Tokens are variable length; the index is keyed by their BLAKE3 digest.
couponguard::schema::bytes_t make_token_index_key(std::string_view token);

couponguard::schema::bytes_t make_code_index_key(std::string_view coupon_code);

couponguard::schema::bytes_t make_coupon_sequence_key();

}  // namespace couponguard::schema::key
