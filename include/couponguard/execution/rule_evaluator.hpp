#pragma once

#include <couponguard/execution/time_source.hpp>
#include <couponguard/execution/verifier.hpp>
#include <couponguard/schema/campaign_state.hpp>
#include <couponguard/schema/coupon_state.hpp>
#include <couponguard/schema/pre_validation_result.hpp>
#include <couponguard/schema/redemption_context.hpp>
#include <couponguard/schema/usage_stats.hpp>
#include <couponguard/schema/validation_outcome.hpp>
#include <couponguard/schema/violation.hpp>
#include <couponguard/storage/coupon_repository.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace couponguard::execution {

/// Everything one eligibility rule may look at.
struct rule_input_t final {
  const couponguard::schema::coupon_state_t& coupon;
  // Token as presented by the caller; the record's own token for code lookups.
  std::string_view presented_token;
  const std::optional<couponguard::schema::campaign_state_t>& campaign;
  const couponguard::schema::redemption_context_t& context;
  couponguard::schema::timestamp_milliseconds_t now{};
  const verifier& token_verifier;
};

using rule_t =
    std::optional<couponguard::schema::violation_t> (*)(const rule_input_t&);

/// Redemption rules in evaluation order. Each yields at most one violation.
const std::vector<rule_t>& redemption_rules();

/// Status, validity window and usage limit only: the checks that must be
/// repeated against a fresh record at consumption time.
std::vector<couponguard::schema::violation_t> usability_violations(
    const couponguard::schema::coupon_state_t& coupon,
    couponguard::schema::timestamp_milliseconds_t now);

/// Read-only redemption eligibility pipeline.
///
/// A record that cannot be found is the only early return. Every other rule
/// runs and all violations are reported together, including rules evaluated
/// against a record whose signature failed (see validation_outcome::
/// authenticated).
class rule_evaluator final {
 public:
  rule_evaluator(couponguard::storage::coupon_repository& repository,
                 const verifier& token_verifier,
                 time_source_t now);

  couponguard::schema::validation_outcome_t validate_for_redemption(
      std::string_view token,
      const couponguard::schema::redemption_context_t& context) const;

  couponguard::schema::validation_outcome_t validate_by_coupon_code(
      std::string_view coupon_code,
      const couponguard::schema::redemption_context_t& context) const;

  /// One outcome per token, in input order, each evaluated independently.
  std::vector<couponguard::schema::validation_outcome_t> validate_batch(
      const std::vector<std::string>& tokens,
      const couponguard::schema::redemption_context_t& context) const;

  couponguard::schema::pre_validation_result_t pre_validate(
      std::string_view token) const;

  std::optional<couponguard::schema::usage_stats_t> usage_stats(
      couponguard::schema::coupon_id_t coupon_id) const;

  /// Run every rule against an already resolved record.
  couponguard::schema::validation_outcome_t evaluate(
      const couponguard::schema::coupon_state_t& coupon,
      std::string_view presented_token,
      const couponguard::schema::redemption_context_t& context) const;

 private:
  couponguard::storage::coupon_repository& repository_;
  const verifier& verifier_;
  time_source_t now_;
};

}  // namespace couponguard::execution
