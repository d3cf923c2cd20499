#include <couponguard/execution/rule_evaluator.hpp>
#include <couponguard/execution/usage_state_machine.hpp>

#include <spdlog/spdlog.h>

#include <utility>

using namespace couponguard::schema;

namespace couponguard::execution {

namespace {

transition_result_t transition_failure(
    const transition_error_code error,
    std::optional<coupon_state_t> coupon = std::nullopt) {
  return transition_result_t{
      .success = false, .coupon = std::move(coupon), .error = error};
}

}  // namespace

usage_state_machine::usage_state_machine(
    couponguard::storage::coupon_repository& repository,
    time_source_t now,
    engine_options options)
    : repository_(repository),
      now_(std::move(now)),
      options_(std::move(options)) {}

transition_result_t usage_state_machine::activate(const coupon_id_t coupon_id) {
  return transition(coupon_id, coupon_status_t::active);
}

transition_result_t usage_state_machine::deactivate(
    const coupon_id_t coupon_id) {
  return transition(coupon_id, coupon_status_t::inactive);
}

transition_result_t usage_state_machine::cancel(const coupon_id_t coupon_id) {
  return transition(coupon_id, coupon_status_t::cancelled);
}

transition_result_t usage_state_machine::transition(
    const coupon_id_t coupon_id,
    const coupon_status_t target) {
  for (auto attempt = uint32_t{0}; attempt < options_.consume_retry_limit;
       ++attempt) {
    auto current = repository_.find_by_id(coupon_id);
    if (!current) {
      return transition_failure(transition_error_code::coupon_missing);
    }
    if (is_terminal(current->status)) {
      spdlog::warn("Coupon {} is {}; cannot move to {}", coupon_id,
                   to_string(current->status), to_string(target));
      return transition_failure(transition_error_code::terminal_status,
                                std::move(current));
    }
    if (current->status == target) {
      return transition_result_t{.success = true, .coupon = std::move(current)};
    }
    if (!can_change_to(current->status, target)) {
      return transition_failure(transition_error_code::invalid_transition,
                                std::move(current));
    }

    auto desired = *current;
    desired.status = target;
    desired.updated_at = now_();
    if (repository_.compare_and_set_coupon(*current, desired) ==
        couponguard::storage::write_status_t::applied) {
      spdlog::info("Coupon {} moved from {} to {}", coupon_id,
                   to_string(current->status), to_string(target));
      return transition_result_t{.success = true, .coupon = std::move(desired)};
    }
    spdlog::debug("Coupon {} changed concurrently; retrying transition",
                  coupon_id);
  }
  spdlog::warn("Gave up moving coupon {} to {} after {} attempts", coupon_id,
               to_string(target), options_.consume_retry_limit);
  return transition_failure(transition_error_code::conflict_retries_exhausted);
}

consume_result_t usage_state_machine::consume_use(const coupon_id_t coupon_id) {
  auto result = consume_result_t{};
  while (result.attempts < options_.consume_retry_limit) {
    ++result.attempts;
    auto current = repository_.find_by_id(coupon_id);
    if (!current) {
      result.violations.push_back(violation_t{
          .code = violation_code::not_found, .message = "coupon not found"});
      result.error = transition_error_code::coupon_missing;
      return result;
    }

    auto now = now_();
    auto violations = usability_violations(*current, now);
    if (!violations.empty()) {
      spdlog::info("Coupon {} cannot be consumed: {}", coupon_id,
                   violations.front().message);
      result.coupon = std::move(current);
      result.violations = std::move(violations);
      return result;
    }

    auto desired = *current;
    desired.current_uses += 1;
    if (desired.max_uses.has_value() &&
        desired.current_uses >= *desired.max_uses) {
      desired.status = coupon_status_t::used_up;
    }
    desired.updated_at = now;

    if (repository_.compare_and_set_coupon(*current, desired) ==
        couponguard::storage::write_status_t::applied) {
      spdlog::info("Coupon {} consumed ({} use(s), status {})", coupon_id,
                   desired.current_uses, to_string(desired.status));
      if (!repository_.increment_campaign_counters(desired.campaign_id, 0, 1)) {
        spdlog::warn("Campaign {} missing; used counter not updated",
                     desired.campaign_id);
      }
      result.success = true;
      result.coupon = std::move(desired);
      return result;
    }
    spdlog::debug("Coupon {} changed concurrently; retrying consumption",
                  coupon_id);
  }

  spdlog::warn("Gave up consuming coupon {} after {} attempts", coupon_id,
               result.attempts);
  result.error = transition_error_code::conflict_retries_exhausted;
  return result;
}

uint64_t usage_state_machine::expire_overdue(
    const timestamp_milliseconds_t now) {
  auto expired = uint64_t{};
  for (const auto& listed : repository_.list_coupons()) {
    if (is_terminal(listed.status) || listed.valid_until >= now) {
      continue;
    }
    for (auto attempt = uint32_t{0}; attempt < options_.consume_retry_limit;
         ++attempt) {
      auto current = repository_.find_by_id(listed.coupon_id);
      if (!current || is_terminal(current->status)) {
        break;
      }
      auto desired = *current;
      desired.status = coupon_status_t::expired;
      desired.updated_at = now;
      if (repository_.compare_and_set_coupon(*current, desired) ==
          couponguard::storage::write_status_t::applied) {
        ++expired;
        break;
      }
    }
  }
  spdlog::info("Expiry sweep marked {} coupon(s) as expired", expired);
  return expired;
}

}  // namespace couponguard::execution
