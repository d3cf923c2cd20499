#pragma once

#include <couponguard/schema/coupon_status.hpp>
#include <couponguard/schema/violation_code.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace couponguard::schema {

struct violation_t final {
  violation_code code{};
  std::string message;
  // Set for status_not_active.
  std::optional<coupon_status_t> status;
};

inline bool contains(const std::vector<violation_t>& violations,
                     const violation_code code) {
  return std::any_of(
      std::begin(violations), std::end(violations),
      [code](const violation_t& value) { return value.code == code; });
}

}  // namespace couponguard::schema
