#pragma once

#include <couponguard/execution/engine_options.hpp>
#include <couponguard/execution/key_provider.hpp>
#include <couponguard/schema/coupon_state.hpp>
#include <couponguard/schema/primitives.hpp>
#include <couponguard/schema/signing_key.hpp>
#include <couponguard/schema/station_access_claims.hpp>

#include <string_view>

namespace couponguard::execution {

/// Token format, authenticity and freshness checks. Every method is pure and
/// safe to call concurrently.
class verifier final {
 public:
  verifier(verification_key_provider_t keys, engine_options options = {});

  /// Structural check only; no key material is touched.
  bool is_well_formed(std::string_view token) const;

  /// Recompute the signature input from the record's own campaign id, code
  /// and issuance time and check `signature` against it. Fails closed on an
  /// empty signature, a missing key or a key of the wrong kind.
  bool verify_signature(std::string_view token,
                        std::string_view signature,
                        const couponguard::schema::coupon_state_t& coupon) const;

  /// True when the issuance time embedded in `token` is more than `max_age`
  /// before `now`. Unparseable tokens are stale.
  bool is_stale_by_timestamp(
      std::string_view token,
      couponguard::schema::duration_milliseconds_t max_age,
      couponguard::schema::timestamp_milliseconds_t now) const;

  /// Same, with the configured maximum age.
  bool is_stale_by_timestamp(
      std::string_view token,
      couponguard::schema::timestamp_milliseconds_t now) const;

  static couponguard::schema::station_token_verification_t
  verify_station_token(std::string_view token,
                       const couponguard::schema::ed25519_public_key_t& key,
                       couponguard::schema::timestamp_milliseconds_t now);

  const engine_options& options() const { return options_; }

 private:
  verification_key_provider_t keys_;
  engine_options options_;
};

}  // namespace couponguard::execution
