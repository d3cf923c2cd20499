#include <couponguard/schema/discount.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace couponguard::schema {

bool is_valid_discount(const discount_t& discount) {
  auto valid = true;
  std::visit(overloaded{[&](const no_discount_t&) { valid = true; },
                        [&](const fixed_amount_discount_t& value) {
                          valid = value.amount > 0;
                        },
                        [&](const percentage_discount_t& value) {
                          valid = value.basis_points <= kMaxBasisPoints;
                        }},
             discount);
  return valid;
}

amount_t calculate_discount(const discount_t& discount,
                            const amount_t purchase_amount) {
  if (purchase_amount <= 0) {
    return 0;
  }
  auto result = amount_t{};
  std::visit(
      overloaded{[&](const no_discount_t&) { result = 0; },
                 [&](const fixed_amount_discount_t& value) {
                   result = std::clamp(value.amount, amount_t{0},
                                       purchase_amount);
                 },
                 [&](const percentage_discount_t& value) {
                   // purchase * bp / 10000, rounded half up.
                   auto basis_points =
                       std::min(value.basis_points, kMaxBasisPoints);
                   result = (purchase_amount *
                                 static_cast<amount_t>(basis_points) +
                             5000) /
                            10000;
                 }},
      discount);
  return result;
}

std::string describe_discount(const discount_t& discount,
                              const uint32_t raffle_tickets) {
  auto description = std::string{};
  std::visit(
      overloaded{[&](const no_discount_t&) {
                   if (raffle_tickets > 0) {
                     description = fmt::format(
                         "raffle tickets only: {} tickets", raffle_tickets);
                   } else {
                     description = "no discount information available";
                   }
                 },
                 [&](const fixed_amount_discount_t& value) {
                   description = fmt::format("fixed discount: {}",
                                             format_amount(value.amount));
                 },
                 [&](const percentage_discount_t& value) {
                   description =
                       fmt::format("percentage discount: {}%",
                                   format_percentage(value.basis_points));
                 }},
      discount);
  return description;
}

}  // namespace couponguard::schema
