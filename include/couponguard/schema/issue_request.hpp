#pragma once

#include <couponguard/schema/discount.hpp>
#include <couponguard/schema/primitives.hpp>

#include <optional>
#include <string>
#include <vector>

namespace couponguard::schema {

template <uint16_t Version>
struct issue_request;

template <>
struct issue_request<1> final {
  uint16_t version{1};
  campaign_id_t campaign_id{};
  // Generated from the campaign name when absent.
  std::optional<std::string> coupon_code;
  timestamp_milliseconds_t valid_from{};
  timestamp_milliseconds_t valid_until{};
  // Campaign defaults apply when absent.
  std::optional<discount_t> discount;
  std::optional<uint32_t> raffle_tickets;
  std::optional<amount_t> minimum_purchase_amount;
  std::vector<std::string> applicable_fuel_types;
  std::vector<station_id_t> applicable_stations;
  std::optional<uint32_t> max_uses;
};

using issue_request_t = issue_request<1>;

}  // namespace couponguard::schema
