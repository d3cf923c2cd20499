#pragma once

#include <couponguard/schema/coupon_state.hpp>

#include <cstdint>
#include <optional>

namespace couponguard::schema {

enum class issue_error_code : uint32_t {
  campaign_missing = 1,
  campaign_inactive = 2,
  campaign_capacity_reached = 3,
  invalid_validity_window = 4,
  invalid_coupon_code = 5,
  coupon_code_in_use = 6,
  signing_failed = 7,
  invalid_usage_limit = 8,
  invalid_discount = 9,
  invalid_minimum_purchase = 10,
};

template <uint16_t Version>
struct issue_result;

template <>
struct issue_result<1> final {
  uint16_t version{1};
  bool success{};
  std::optional<coupon_state_t> coupon;
  std::optional<issue_error_code> error;
};

using issue_result_t = issue_result<1>;

}  // namespace couponguard::schema
