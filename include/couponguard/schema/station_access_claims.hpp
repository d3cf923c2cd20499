#pragma once
#include <couponguard/schema/primitives.hpp>

#include <array>
#include <optional>
#include <string>

// Schema type: station access claims.
// Authorizes one dispenser for a bounded window; never stored.
namespace couponguard::schema {

template <uint16_t Version>
struct station_access_claims;

template <>
struct station_access_claims<1> final {
  uint16_t version{1};
  station_id_t station_id{};
  std::string dispenser_id;
  std::array<uint8_t, 16> nonce{};
  timestamp_milliseconds_t issued_at{};
  timestamp_milliseconds_t expires_at{};

  bool operator==(const station_access_claims<1>&) const = default;
};

using station_access_claims_t = station_access_claims<1>;

enum class station_token_status_t : uint8_t {
  valid = 0,
  malformed = 1,
  signature_invalid = 2,
  expired = 3,
};

struct station_token_verification_t final {
  station_token_status_t status{station_token_status_t::malformed};
  // Present once the payload decoded, including for expired tokens.
  std::optional<station_access_claims_t> claims;
};

}  // namespace couponguard::schema
