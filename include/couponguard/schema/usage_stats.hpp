#pragma once

#include <couponguard/schema/primitives.hpp>

#include <optional>
#include <string>

namespace couponguard::schema {

struct usage_stats_t final {
  coupon_id_t coupon_id{};
  std::string coupon_code;
  uint32_t current_uses{};
  std::optional<uint32_t> max_uses;
  std::optional<uint32_t> remaining_uses;
  // Percent of max_uses consumed; 0 for unlimited coupons.
  double usage_rate{};
  bool is_max_uses_reached{};
};

}  // namespace couponguard::schema
