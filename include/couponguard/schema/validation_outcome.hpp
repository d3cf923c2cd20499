#pragma once

#include <couponguard/schema/coupon_state.hpp>
#include <couponguard/schema/violation.hpp>

#include <optional>
#include <vector>

namespace couponguard::schema {

template <uint16_t Version>
struct validation_outcome;

template <>
struct validation_outcome<1> final {
  uint16_t version{1};
  bool is_valid{};
  // is_valid and the coupon still has capacity.
  bool can_be_used{};
  // False when the record could not be resolved at all; violations then
  // holds the single not_found entry.
  bool found{};
  // Format and signature both passed. Other violations on an unauthenticated
  // record are diagnostics against untrusted data.
  bool authenticated{};
  std::optional<coupon_state_t> coupon;
  std::vector<violation_t> violations;
};

using validation_outcome_t = validation_outcome<1>;

}  // namespace couponguard::schema
