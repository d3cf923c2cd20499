#pragma once

#include <couponguard/execution/engine_options.hpp>
#include <couponguard/execution/key_provider.hpp>
#include <couponguard/schema/coupon_token.hpp>
#include <couponguard/schema/primitives.hpp>
#include <couponguard/schema/signing_key.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace couponguard::execution {

/// Builds and signs coupon tokens and station access tokens.
class signer final {
 public:
  signer(signing_key_provider_t keys, engine_options options = {});

  /// Build a token for `coupon_code` with a fresh random sequence and nonce,
  /// and sign it together with the campaign id, code and issuance time.
  ///
  /// std::nullopt when the code is malformed or no usable key is provisioned
  /// for the campaign.
  std::optional<couponguard::schema::signed_coupon_token_t> sign_coupon_token(
      couponguard::schema::campaign_id_t campaign_id,
      std::string_view coupon_code,
      couponguard::schema::timestamp_milliseconds_t issued_at) const;

  /// Signature over an already-built token and the record fields bound to it.
  std::optional<std::string> sign_token_fields(
      std::string_view token,
      couponguard::schema::campaign_id_t campaign_id,
      std::string_view coupon_code,
      couponguard::schema::timestamp_milliseconds_t issued_at) const;

  /// Short-lived dispenser authorization, always Ed25519.
  static std::optional<std::string> sign_station_token(
      couponguard::schema::station_id_t station_id,
      std::string_view dispenser_id,
      couponguard::schema::timestamp_milliseconds_t issued_at,
      couponguard::schema::timestamp_milliseconds_t expires_at,
      const couponguard::schema::ed25519_private_key_t& key);

 private:
  signing_key_provider_t keys_;
  engine_options options_;
};

/// Random code of `length` characters from [A-Z0-9], or PREFIX-RANDOM when a
/// prefix is given (the prefix and dash count towards `length`). Length must
/// be 6..20.
std::optional<std::string> generate_coupon_code(size_t length = 12,
                                                std::string_view prefix = {});

/// First four alphanumerics of a campaign name, uppercased.
std::string campaign_code_prefix(std::string_view campaign_name);

}  // namespace couponguard::execution
