#pragma once
#include <couponguard/schema/primitives.hpp>

#include <cstdint>
#include <string>
#include <variant>

// Schema type: discount terms.
// A coupon grants a fixed amount, a percentage, or no monetary discount
// (raffle tickets only). At most one kind is ever present.
namespace couponguard::schema {

struct no_discount_t final {
  bool operator==(const no_discount_t&) const = default;
};

struct fixed_amount_discount_t final {
  amount_t amount{};
  bool operator==(const fixed_amount_discount_t&) const = default;
};

struct percentage_discount_t final {
  basis_points_t basis_points{};
  bool operator==(const percentage_discount_t&) const = default;
};

using discount_t = std::variant<no_discount_t,
                                fixed_amount_discount_t,
                                percentage_discount_t>;

inline constexpr auto kMaxBasisPoints = basis_points_t{10'000};

/// Fixed amounts must be positive and percentages at most 100%.
bool is_valid_discount(const discount_t& discount);

/// Discount owed on `purchase_amount`, in minor units. Percentages round half
/// up; the result is clamped to [0, purchase_amount].
amount_t calculate_discount(const discount_t& discount,
                            amount_t purchase_amount);

/// Short human-readable summary used by pre-validation.
std::string describe_discount(const discount_t& discount,
                              uint32_t raffle_tickets);

}  // namespace couponguard::schema
