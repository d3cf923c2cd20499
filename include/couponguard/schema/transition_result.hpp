#pragma once

#include <couponguard/schema/coupon_state.hpp>

#include <cstdint>
#include <optional>

namespace couponguard::schema {

enum class transition_error_code : uint32_t {
  coupon_missing = 1,
  terminal_status = 2,
  invalid_transition = 3,
  conflict_retries_exhausted = 4,
};

template <uint16_t Version>
struct transition_result;

template <>
struct transition_result<1> final {
  uint16_t version{1};
  bool success{};
  std::optional<coupon_state_t> coupon;
  std::optional<transition_error_code> error;
};

using transition_result_t = transition_result<1>;

}  // namespace couponguard::schema
