#pragma once

#include <couponguard/schema/primitives.hpp>
#include <couponguard/schema/signing_key.hpp>

#include <functional>
#include <optional>

namespace couponguard::execution {

/// Key used to sign a campaign's coupons; std::nullopt when none is
/// provisioned, which makes signing fail.
using signing_key_provider_t =
    std::function<std::optional<couponguard::schema::signing_key_t>(
        couponguard::schema::campaign_id_t campaign_id)>;

/// Key used to verify a campaign's coupons; std::nullopt fails verification.
using verification_key_provider_t =
    std::function<std::optional<couponguard::schema::verification_key_t>(
        couponguard::schema::campaign_id_t campaign_id)>;

/// One key for every campaign.
signing_key_provider_t make_global_signing_key_provider(
    couponguard::schema::signing_key_t key);

verification_key_provider_t make_global_verification_key_provider(
    couponguard::schema::verification_key_t key);

/// Verification keys derived from whatever `signing` provides.
verification_key_provider_t make_derived_verification_key_provider(
    signing_key_provider_t signing);

}  // namespace couponguard::execution
