#pragma once

#include <couponguard/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: coupon status.
// Coupon lifecycle: active and inactive are reversible administrative states;
// expired, used_up and cancelled are terminal.
namespace couponguard::schema {

enum class coupon_status_t : uint8_t {
  active = 0,
  inactive = 1,
  expired = 2,
  used_up = 3,
  cancelled = 4
};

inline constexpr auto kCouponStatusMappings =
    std::array{enum_mapping_t<coupon_status_t>{
                   "ACTIVE", coupon_status_t::active},
               enum_mapping_t<coupon_status_t>{
                   "INACTIVE", coupon_status_t::inactive},
               enum_mapping_t<coupon_status_t>{
                   "EXPIRED", coupon_status_t::expired},
               enum_mapping_t<coupon_status_t>{
                   "USED_UP", coupon_status_t::used_up},
               enum_mapping_t<coupon_status_t>{
                   "CANCELLED", coupon_status_t::cancelled}};

template <>
inline std::optional<coupon_status_t> try_from_string<coupon_status_t>(
    const std::string_view value) {
  return from_string(value, kCouponStatusMappings);
}

inline constexpr std::string_view to_string(const coupon_status_t value) {
  return to_string(value, kCouponStatusMappings).value_or("UNKNOWN");
}

inline constexpr bool is_terminal(const coupon_status_t value) {
  return value == coupon_status_t::expired ||
         value == coupon_status_t::used_up ||
         value == coupon_status_t::cancelled;
}

inline constexpr bool can_change_to(const coupon_status_t from,
                                    const coupon_status_t to) {
  switch (from) {
    case coupon_status_t::active:
      return to != coupon_status_t::active;
    case coupon_status_t::inactive:
      return to == coupon_status_t::active ||
             to == coupon_status_t::expired ||
             to == coupon_status_t::cancelled;
    case coupon_status_t::expired:
    case coupon_status_t::used_up:
    case coupon_status_t::cancelled:
      return false;
  }
  return false;
}

}  // namespace couponguard::schema
