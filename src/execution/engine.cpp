#include <couponguard/execution/engine.hpp>
#include <couponguard/token/coupon_token.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

using namespace couponguard::schema;

namespace couponguard::execution {

namespace {

inline constexpr auto kGeneratedCodeLength = size_t{12};

issue_result_t issue_failure(const issue_error_code error) {
  return issue_result_t{.success = false, .error = error};
}

}  // namespace

engine::engine(
    couponguard::storage::storage<couponguard::storage::rocksdb_storage_tag>&
        storage,
    signing_key_provider_t signing_keys,
    verification_key_provider_t verification_keys,
    time_source_t now,
    engine_options options)
    : now_(std::move(now)),
      options_(std::move(options)),
      repository_(storage),
      signer_(std::move(signing_keys), options_),
      verifier_(std::move(verification_keys), options_),
      rule_evaluator_(repository_, verifier_, now_),
      usage_state_machine_(repository_, now_, options_),
      integrity_auditor_(repository_, verifier_) {
  spdlog::info("Coupon engine ready (token {}_{}, max token age {} ms)",
               options_.token_prefix, options_.token_version,
               options_.max_token_age);
}

issue_result_t engine::issue_coupon(const issue_request_t& request) {
  auto campaign = repository_.find_campaign(request.campaign_id);
  if (!campaign) {
    return issue_failure(issue_error_code::campaign_missing);
  }
  auto now = now_();
  if (campaign->status != campaign_status_t::active ||
      now < campaign->start_date || now > campaign->end_date) {
    spdlog::warn("Campaign {} is not issuing coupons (status {})",
                 campaign->campaign_id, to_string(campaign->status));
    return issue_failure(issue_error_code::campaign_inactive);
  }
  if (request.valid_from > request.valid_until) {
    return issue_failure(issue_error_code::invalid_validity_window);
  }
  // A zero limit would store an ACTIVE coupon that is already exhausted.
  if (request.max_uses.has_value() && *request.max_uses == 0) {
    return issue_failure(issue_error_code::invalid_usage_limit);
  }
  auto discount = request.discount.value_or(campaign->default_discount);
  if (!is_valid_discount(discount)) {
    spdlog::warn("Rejecting coupon for campaign {}: invalid discount terms",
                 campaign->campaign_id);
    return issue_failure(issue_error_code::invalid_discount);
  }
  if (request.minimum_purchase_amount.value_or(0) < 0) {
    return issue_failure(issue_error_code::invalid_minimum_purchase);
  }

  auto coupon_code = request.coupon_code.has_value()
                         ? request.coupon_code
                         : generate_coupon_code(
                               kGeneratedCodeLength,
                               campaign_code_prefix(campaign->name));
  if (!coupon_code || !couponguard::token::is_valid_coupon_code(*coupon_code)) {
    return issue_failure(issue_error_code::invalid_coupon_code);
  }

  auto signed_token =
      signer_.sign_coupon_token(campaign->campaign_id, *coupon_code, now);
  if (!signed_token) {
    return issue_failure(issue_error_code::signing_failed);
  }

  switch (repository_.reserve_coupon_slot(campaign->campaign_id)) {
    case couponguard::storage::slot_reservation_t::reserved:
      break;
    case couponguard::storage::slot_reservation_t::capacity_reached:
      spdlog::warn("Campaign {} reached its coupon limit",
                   campaign->campaign_id);
      return issue_failure(issue_error_code::campaign_capacity_reached);
    case couponguard::storage::slot_reservation_t::campaign_missing:
      return issue_failure(issue_error_code::campaign_missing);
  }

  auto coupon = coupon_state_t{
      .coupon_id = repository_.next_coupon_id(),
      .campaign_id = campaign->campaign_id,
      .token = std::move(signed_token->token),
      .token_signature = std::move(signed_token->signature),
      .coupon_code = *coupon_code,
      .issued_at = signed_token->issued_at,
      .status = coupon_status_t::active,
      .valid_from = request.valid_from,
      .valid_until = request.valid_until,
      .discount = std::move(discount),
      .minimum_purchase_amount = request.minimum_purchase_amount,
      .applicable_fuel_types = request.applicable_fuel_types,
      .applicable_stations = request.applicable_stations,
      .max_uses = request.max_uses,
      .current_uses = 0,
      .raffle_tickets =
          request.raffle_tickets.value_or(campaign->raffle_tickets_per_coupon),
      .updated_at = now};
  std::sort(std::begin(coupon.applicable_fuel_types),
            std::end(coupon.applicable_fuel_types));
  std::sort(std::begin(coupon.applicable_stations),
            std::end(coupon.applicable_stations));

  if (repository_.insert_coupon(coupon) !=
      couponguard::storage::write_status_t::applied) {
    repository_.release_coupon_slot(campaign->campaign_id);
    return issue_failure(issue_error_code::coupon_code_in_use);
  }
  spdlog::info("Issued coupon {} ('{}') for campaign {}", coupon.coupon_id,
               coupon.coupon_code, coupon.campaign_id);
  return issue_result_t{.success = true, .coupon = std::move(coupon)};
}

validation_outcome_t engine::validate_for_redemption(
    std::string_view token,
    const redemption_context_t& context) const {
  return rule_evaluator_.validate_for_redemption(token, context);
}

validation_outcome_t engine::validate_by_coupon_code(
    std::string_view coupon_code,
    const redemption_context_t& context) const {
  return rule_evaluator_.validate_by_coupon_code(coupon_code, context);
}

std::vector<validation_outcome_t> engine::validate_batch(
    const std::vector<std::string>& tokens,
    const redemption_context_t& context) const {
  return rule_evaluator_.validate_batch(tokens, context);
}

pre_validation_result_t engine::pre_validate(std::string_view token) const {
  return rule_evaluator_.pre_validate(token);
}

std::optional<usage_stats_t> engine::usage_stats(
    const coupon_id_t coupon_id) const {
  return rule_evaluator_.usage_stats(coupon_id);
}

consume_result_t engine::consume_use(const coupon_id_t coupon_id) {
  return usage_state_machine_.consume_use(coupon_id);
}

transition_result_t engine::activate(const coupon_id_t coupon_id) {
  return usage_state_machine_.activate(coupon_id);
}

transition_result_t engine::deactivate(const coupon_id_t coupon_id) {
  return usage_state_machine_.deactivate(coupon_id);
}

transition_result_t engine::cancel(const coupon_id_t coupon_id) {
  return usage_state_machine_.cancel(coupon_id);
}

uint64_t engine::expire_overdue() {
  return usage_state_machine_.expire_overdue(now_());
}

integrity_report_t engine::check_integrity(const coupon_state_t& coupon) const {
  return integrity_auditor_.check_integrity(coupon);
}

std::vector<integrity_report_t> engine::audit_all() const {
  return integrity_auditor_.audit_all();
}

}  // namespace couponguard::execution
