#include <couponguard/schema/coupon_state.hpp>

namespace couponguard::schema {

std::optional<coupon_state<2>> try_upgrade(const coupon_state<1>& legacy) {
  if (legacy.discount_amount.has_value() &&
      legacy.discount_percentage.has_value()) {
    return std::nullopt;
  }

  auto discount = discount_t{no_discount_t{}};
  if (legacy.discount_amount.has_value()) {
    discount = fixed_amount_discount_t{.amount = *legacy.discount_amount};
  } else if (legacy.discount_percentage.has_value()) {
    discount =
        percentage_discount_t{.basis_points = *legacy.discount_percentage};
  }

  return coupon_state<2>{
      .coupon_id = legacy.coupon_id,
      .campaign_id = legacy.campaign_id,
      .token = legacy.token,
      .token_signature = legacy.token_signature,
      .coupon_code = legacy.coupon_code,
      .issued_at = legacy.issued_at,
      .status = legacy.status,
      .valid_from = legacy.valid_from,
      .valid_until = legacy.valid_until,
      .discount = discount,
      .minimum_purchase_amount = legacy.minimum_purchase_amount,
      .applicable_fuel_types = legacy.applicable_fuel_types,
      .applicable_stations = legacy.applicable_stations,
      .max_uses = legacy.max_uses,
      .current_uses = legacy.current_uses,
      .raffle_tickets = legacy.raffle_tickets};
}

std::optional<uint32_t> remaining_uses(const coupon_state_t& coupon) {
  if (!coupon.max_uses.has_value()) {
    return std::nullopt;
  }
  if (coupon.current_uses >= *coupon.max_uses) {
    return 0u;
  }
  return *coupon.max_uses - coupon.current_uses;
}

bool has_remaining_capacity(const coupon_state_t& coupon) {
  auto remaining = remaining_uses(coupon);
  return !remaining.has_value() || *remaining > 0;
}

}  // namespace couponguard::schema
