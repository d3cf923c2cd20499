#pragma once
#include <couponguard/schema/primitives.hpp>

#include <optional>
#include <string>

namespace couponguard::schema {

/// Where and for what a coupon is being redeemed. Absent fields skip the
/// matching applicability rule.
struct redemption_context_t final {
  std::optional<station_id_t> station_id;
  std::optional<std::string> fuel_type;
  std::optional<amount_t> purchase_amount;
};

}  // namespace couponguard::schema
