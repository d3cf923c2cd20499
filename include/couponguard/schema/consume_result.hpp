#pragma once

#include <couponguard/schema/coupon_state.hpp>
#include <couponguard/schema/transition_result.hpp>
#include <couponguard/schema/violation.hpp>

#include <optional>
#include <vector>

namespace couponguard::schema {

template <uint16_t Version>
struct consume_result;

template <>
struct consume_result<1> final {
  uint16_t version{1};
  bool success{};
  // Post-update record on success, freshest observed record on failure.
  std::optional<coupon_state_t> coupon;
  std::vector<violation_t> violations;
  // Set when the coupon could not be loaded or every optimistic attempt lost
  // a race; violations is empty in the latter case.
  std::optional<transition_error_code> error;
  uint32_t attempts{};
};

using consume_result_t = consume_result<1>;

}  // namespace couponguard::schema
