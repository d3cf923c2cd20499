#pragma once

#include <couponguard/execution/engine_options.hpp>
#include <couponguard/execution/integrity_auditor.hpp>
#include <couponguard/execution/key_provider.hpp>
#include <couponguard/execution/rule_evaluator.hpp>
#include <couponguard/execution/signer.hpp>
#include <couponguard/execution/time_source.hpp>
#include <couponguard/execution/usage_state_machine.hpp>
#include <couponguard/execution/verifier.hpp>
#include <couponguard/schema/consume_result.hpp>
#include <couponguard/schema/integrity_report.hpp>
#include <couponguard/schema/issue_request.hpp>
#include <couponguard/schema/issue_result.hpp>
#include <couponguard/schema/pre_validation_result.hpp>
#include <couponguard/schema/redemption_context.hpp>
#include <couponguard/schema/transition_result.hpp>
#include <couponguard/schema/usage_stats.hpp>
#include <couponguard/schema/validation_outcome.hpp>
#include <couponguard/storage/coupon_repository.hpp>
#include <couponguard/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace couponguard::execution {

/// Coupon integrity and redemption engine.
///
/// Wires the signer, verifier, rule evaluator, usage state machine and
/// integrity auditor over one repository. Safe to share between threads;
/// concurrent writers are reconciled by the repository's compare-and-set.
class engine final {
 public:
  /// `signing_keys` may be empty on redemption-only deployments; issuing then
  /// fails with signing_failed.
  engine(couponguard::storage::storage<couponguard::storage::rocksdb_storage_tag>&
             storage,
         signing_key_provider_t signing_keys,
         verification_key_provider_t verification_keys,
         time_source_t now = system_time_source(),
         engine_options options = {});

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Create, sign and persist a coupon for an active campaign.
  couponguard::schema::issue_result_t issue_coupon(
      const couponguard::schema::issue_request_t& request);

  couponguard::schema::validation_outcome_t validate_for_redemption(
      std::string_view token,
      const couponguard::schema::redemption_context_t& context) const;

  couponguard::schema::validation_outcome_t validate_by_coupon_code(
      std::string_view coupon_code,
      const couponguard::schema::redemption_context_t& context) const;

  std::vector<couponguard::schema::validation_outcome_t> validate_batch(
      const std::vector<std::string>& tokens,
      const couponguard::schema::redemption_context_t& context) const;

  couponguard::schema::pre_validation_result_t pre_validate(
      std::string_view token) const;

  std::optional<couponguard::schema::usage_stats_t> usage_stats(
      couponguard::schema::coupon_id_t coupon_id) const;

  couponguard::schema::consume_result_t consume_use(
      couponguard::schema::coupon_id_t coupon_id);

  couponguard::schema::transition_result_t activate(
      couponguard::schema::coupon_id_t coupon_id);
  couponguard::schema::transition_result_t deactivate(
      couponguard::schema::coupon_id_t coupon_id);
  couponguard::schema::transition_result_t cancel(
      couponguard::schema::coupon_id_t coupon_id);

  /// Expire overdue coupons as of the engine's current time.
  uint64_t expire_overdue();

  couponguard::schema::integrity_report_t check_integrity(
      const couponguard::schema::coupon_state_t& coupon) const;

  std::vector<couponguard::schema::integrity_report_t> audit_all() const;

  couponguard::storage::coupon_repository& repository() { return repository_; }
  const signer& coupon_signer() const { return signer_; }
  const verifier& token_verifier() const { return verifier_; }

 private:
  time_source_t now_;
  engine_options options_;
  couponguard::storage::coupon_repository repository_;
  signer signer_;
  verifier verifier_;
  rule_evaluator rule_evaluator_;
  usage_state_machine usage_state_machine_;
  integrity_auditor integrity_auditor_;
};

}  // namespace couponguard::execution
