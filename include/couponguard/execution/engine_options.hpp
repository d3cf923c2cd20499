#pragma once

#include <couponguard/schema/primitives.hpp>
#include <couponguard/token/coupon_token.hpp>

#include <cstdint>
#include <string>

namespace couponguard::execution {

struct engine_options final {
  // Tokens older than this are rejected as stale regardless of the coupon's
  // own validity window.
  couponguard::schema::duration_milliseconds_t max_token_age{
      24 * couponguard::schema::kMillisecondsPerHour};
  // Optimistic attempts per consume_use before giving up on a hot coupon.
  uint32_t consume_retry_limit{8};
  std::string token_prefix{couponguard::token::kDefaultPrefix};
  std::string token_version{couponguard::token::kDefaultVersion};
};

}  // namespace couponguard::execution
