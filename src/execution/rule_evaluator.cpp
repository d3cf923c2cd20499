#include <couponguard/execution/rule_evaluator.hpp>
#include <couponguard/schema/discount.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

using namespace couponguard::schema;

namespace {

using couponguard::execution::rule_input_t;
using couponguard::execution::rule_t;

violation_t make_violation(const violation_code code, std::string message) {
  return violation_t{.code = code, .message = std::move(message)};
}

std::optional<violation_t> check_token_format(const rule_input_t& input) {
  if (input.token_verifier.is_well_formed(input.presented_token)) {
    return std::nullopt;
  }
  return make_violation(violation_code::malformed_token,
                        "invalid token format");
}

std::optional<violation_t> check_signature(const rule_input_t& input) {
  if (input.token_verifier.verify_signature(input.presented_token,
                                            input.coupon.token_signature,
                                            input.coupon)) {
    return std::nullopt;
  }
  spdlog::warn("Signature mismatch for coupon {}", input.coupon.coupon_id);
  return make_violation(violation_code::signature_invalid,
                        "invalid signature - possible tampering detected");
}

std::optional<violation_t> check_staleness(const rule_input_t& input) {
  if (!input.token_verifier.is_stale_by_timestamp(input.presented_token,
                                                  input.now)) {
    return std::nullopt;
  }
  return make_violation(violation_code::token_stale,
                        "token has expired due to age");
}

std::optional<violation_t> check_status(const coupon_state_t& coupon) {
  if (coupon.status == coupon_status_t::active) {
    return std::nullopt;
  }
  auto violation = make_violation(
      violation_code::status_not_active,
      fmt::format("coupon is not active (status: {})", to_string(coupon.status)));
  violation.status = coupon.status;
  return violation;
}

std::optional<violation_t> check_validity_window(
    const coupon_state_t& coupon,
    const timestamp_milliseconds_t now) {
  if (now < coupon.valid_from) {
    return make_violation(violation_code::not_yet_valid,
                          "coupon is not yet valid");
  }
  if (now > coupon.valid_until) {
    return make_violation(violation_code::expired, "coupon has expired");
  }
  return std::nullopt;
}

std::optional<violation_t> check_usage_limit(const coupon_state_t& coupon) {
  if (coupon.max_uses.has_value() && coupon.current_uses >= *coupon.max_uses) {
    return make_violation(violation_code::usage_limit_reached,
                          "coupon has reached maximum usage limit");
  }
  return std::nullopt;
}

std::optional<violation_t> check_campaign(const rule_input_t& input) {
  if (!input.campaign.has_value()) {
    return make_violation(violation_code::campaign_inactive,
                          "campaign not found");
  }
  if (input.campaign->status != campaign_status_t::active) {
    return make_violation(violation_code::campaign_inactive,
                          "campaign is not active");
  }
  return std::nullopt;
}

std::optional<violation_t> check_station(const rule_input_t& input) {
  const auto& stations = input.coupon.applicable_stations;
  if (stations.empty() || !input.context.station_id.has_value()) {
    return std::nullopt;
  }
  if (std::find(std::begin(stations), std::end(stations),
                *input.context.station_id) != std::end(stations)) {
    return std::nullopt;
  }
  return make_violation(
      violation_code::station_mismatch,
      fmt::format("coupon is not valid at station {}", *input.context.station_id));
}

std::optional<violation_t> check_fuel_type(const rule_input_t& input) {
  const auto& fuel_types = input.coupon.applicable_fuel_types;
  if (fuel_types.empty() || !input.context.fuel_type.has_value()) {
    return std::nullopt;
  }
  if (std::find(std::begin(fuel_types), std::end(fuel_types),
                *input.context.fuel_type) != std::end(fuel_types)) {
    return std::nullopt;
  }
  return make_violation(violation_code::fuel_type_mismatch,
                        fmt::format("coupon is not valid for fuel type '{}'",
                                    *input.context.fuel_type));
}

std::optional<violation_t> check_minimum_purchase(const rule_input_t& input) {
  const auto& minimum = input.coupon.minimum_purchase_amount;
  if (!minimum.has_value() || !input.context.purchase_amount.has_value()) {
    return std::nullopt;
  }
  if (*input.context.purchase_amount >= *minimum) {
    return std::nullopt;
  }
  return make_violation(violation_code::minimum_purchase_not_met,
                        fmt::format("minimum purchase amount of {} required",
                                    format_amount(*minimum)));
}

}  // namespace

namespace couponguard::execution {

const std::vector<rule_t>& redemption_rules() {
  static const auto rules = std::vector<rule_t>{
      check_token_format,
      check_signature,
      check_staleness,
      [](const rule_input_t& input) { return check_status(input.coupon); },
      [](const rule_input_t& input) {
        return check_validity_window(input.coupon, input.now);
      },
      [](const rule_input_t& input) { return check_usage_limit(input.coupon); },
      check_campaign,
      check_station,
      check_fuel_type,
      check_minimum_purchase};
  return rules;
}

std::vector<violation_t> usability_violations(
    const coupon_state_t& coupon,
    const timestamp_milliseconds_t now) {
  auto violations = std::vector<violation_t>{};
  for (auto violation : {check_status(coupon),
                         check_validity_window(coupon, now),
                         check_usage_limit(coupon)}) {
    if (violation) {
      violations.push_back(std::move(*violation));
    }
  }
  return violations;
}

rule_evaluator::rule_evaluator(
    couponguard::storage::coupon_repository& repository,
    const verifier& token_verifier,
    time_source_t now)
    : repository_(repository), verifier_(token_verifier), now_(std::move(now)) {}

validation_outcome_t rule_evaluator::validate_for_redemption(
    std::string_view token,
    const redemption_context_t& context) const {
  auto coupon = repository_.find_by_token(token);
  if (!coupon) {
    spdlog::debug("Redemption attempt for unknown token");
    return validation_outcome_t{
        .violations = {make_violation(violation_code::not_found,
                                      "coupon not found")}};
  }
  return evaluate(*coupon, token, context);
}

validation_outcome_t rule_evaluator::validate_by_coupon_code(
    std::string_view coupon_code,
    const redemption_context_t& context) const {
  auto coupon = repository_.find_by_code(coupon_code);
  if (!coupon) {
    spdlog::debug("Redemption attempt for unknown coupon code '{}'",
                  coupon_code);
    return validation_outcome_t{
        .violations = {make_violation(violation_code::not_found,
                                      "coupon not found")}};
  }
  return evaluate(*coupon, coupon->token, context);
}

std::vector<validation_outcome_t> rule_evaluator::validate_batch(
    const std::vector<std::string>& tokens,
    const redemption_context_t& context) const {
  auto outcomes = std::vector<validation_outcome_t>{};
  outcomes.reserve(tokens.size());
  for (const auto& token : tokens) {
    outcomes.push_back(validate_for_redemption(token, context));
  }
  return outcomes;
}

pre_validation_result_t rule_evaluator::pre_validate(
    std::string_view token) const {
  auto result = pre_validation_result_t{};
  auto coupon = repository_.find_by_token(token);
  if (!coupon) {
    return result;
  }
  auto now = now_();
  result.exists = true;
  result.is_active = coupon->status == coupon_status_t::active &&
                     now >= coupon->valid_from && now <= coupon->valid_until;
  result.is_expired =
      coupon->status == coupon_status_t::expired || now > coupon->valid_until;
  result.campaign_id = coupon->campaign_id;
  auto campaign = repository_.find_campaign(coupon->campaign_id);
  if (campaign) {
    result.campaign_name = campaign->name;
  }
  result.discount_info =
      describe_discount(coupon->discount, coupon->raffle_tickets);
  return result;
}

std::optional<usage_stats_t> rule_evaluator::usage_stats(
    const coupon_id_t coupon_id) const {
  auto coupon = repository_.find_by_id(coupon_id);
  if (!coupon) {
    return std::nullopt;
  }
  auto stats = usage_stats_t{.coupon_id = coupon->coupon_id,
                             .coupon_code = coupon->coupon_code,
                             .current_uses = coupon->current_uses,
                             .max_uses = coupon->max_uses,
                             .remaining_uses = remaining_uses(*coupon)};
  if (coupon->max_uses.has_value() && *coupon->max_uses > 0) {
    stats.usage_rate = 100.0 * static_cast<double>(coupon->current_uses) /
                       static_cast<double>(*coupon->max_uses);
    stats.is_max_uses_reached = coupon->current_uses >= *coupon->max_uses;
  }
  return stats;
}

validation_outcome_t rule_evaluator::evaluate(
    const coupon_state_t& coupon,
    std::string_view presented_token,
    const redemption_context_t& context) const {
  auto campaign = repository_.find_campaign(coupon.campaign_id);
  auto input = rule_input_t{.coupon = coupon,
                            .presented_token = presented_token,
                            .campaign = campaign,
                            .context = context,
                            .now = now_(),
                            .token_verifier = verifier_};

  auto outcome = validation_outcome_t{.found = true, .coupon = coupon};
  for (const auto rule : redemption_rules()) {
    auto violation = rule(input);
    if (violation) {
      spdlog::debug("Coupon {} violation: {}", coupon.coupon_id,
                    violation->message);
      outcome.violations.push_back(std::move(*violation));
    }
  }

  outcome.authenticated =
      !contains(outcome.violations, violation_code::malformed_token) &&
      !contains(outcome.violations, violation_code::signature_invalid);
  outcome.is_valid = outcome.violations.empty();
  outcome.can_be_used = outcome.is_valid && has_remaining_capacity(coupon);
  return outcome;
}

}  // namespace couponguard::execution
