#pragma once
#include <couponguard/schema/coupon_status.hpp>
#include <couponguard/schema/discount.hpp>
#include <couponguard/schema/primitives.hpp>

#include <optional>
#include <string>
#include <vector>

namespace couponguard::schema {

template <uint16_t Version>
struct coupon_state;

// Layout of records migrated from the relational store: the discount is two
// independent nullable columns, so nothing prevents both being set.
template <>
struct coupon_state<1> final {
  uint16_t version{1};
  coupon_id_t coupon_id{};
  campaign_id_t campaign_id{};
  std::string token;
  std::string token_signature;
  std::string coupon_code;
  timestamp_milliseconds_t issued_at{};
  coupon_status_t status{coupon_status_t::active};
  timestamp_milliseconds_t valid_from{};
  timestamp_milliseconds_t valid_until{};
  std::optional<amount_t> discount_amount;
  std::optional<basis_points_t> discount_percentage;
  std::optional<amount_t> minimum_purchase_amount;
  std::vector<std::string> applicable_fuel_types;  // sorted, empty == all
  std::vector<station_id_t> applicable_stations;   // sorted, empty == all
  std::optional<uint32_t> max_uses;                // empty == unlimited
  uint32_t current_uses{};
  uint32_t raffle_tickets{1};

  bool operator==(const coupon_state<1>&) const = default;
};

template <>
struct coupon_state<2> final {
  uint16_t version{2};
  coupon_id_t coupon_id{};
  campaign_id_t campaign_id{};
  std::string token;
  std::string token_signature;
  std::string coupon_code;
  timestamp_milliseconds_t issued_at{};
  coupon_status_t status{coupon_status_t::active};
  timestamp_milliseconds_t valid_from{};
  timestamp_milliseconds_t valid_until{};
  discount_t discount{no_discount_t{}};
  std::optional<amount_t> minimum_purchase_amount;
  std::vector<std::string> applicable_fuel_types;  // sorted, empty == all
  std::vector<station_id_t> applicable_stations;   // sorted, empty == all
  std::optional<uint32_t> max_uses;                // empty == unlimited
  uint32_t current_uses{};
  uint32_t raffle_tickets{1};
  timestamp_milliseconds_t updated_at{};

  bool operator==(const coupon_state<2>&) const = default;
};

using coupon_state_t = coupon_state<2>;

/// Convert a migrated record; std::nullopt when both discount columns are set.
std::optional<coupon_state<2>> try_upgrade(const coupon_state<1>& legacy);

/// Remaining uses, or std::nullopt for unlimited coupons.
std::optional<uint32_t> remaining_uses(const coupon_state_t& coupon);

bool has_remaining_capacity(const coupon_state_t& coupon);

}  // namespace couponguard::schema
