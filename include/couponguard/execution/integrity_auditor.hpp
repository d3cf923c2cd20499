#pragma once

#include <couponguard/execution/verifier.hpp>
#include <couponguard/schema/coupon_state.hpp>
#include <couponguard/schema/integrity_report.hpp>
#include <couponguard/storage/coupon_repository.hpp>

#include <vector>

namespace couponguard::execution {

/// Offline structural checks over stored coupons. Never mutates anything and
/// never takes part in redemption.
class integrity_auditor final {
 public:
  integrity_auditor(const couponguard::storage::coupon_repository& repository,
                    const verifier& token_verifier);

  couponguard::schema::integrity_report_t check_integrity(
      const couponguard::schema::coupon_state_t& coupon) const;

  /// Legacy records can additionally carry both discount columns.
  couponguard::schema::integrity_report_t check_integrity(
      const couponguard::schema::coupon_state<1>& coupon) const;

  couponguard::schema::integrity_report_t check_integrity(
      const couponguard::storage::stored_coupon_t& coupon) const;

  /// Report for every stored coupon, ordered by id.
  std::vector<couponguard::schema::integrity_report_t> audit_all() const;

 private:
  const couponguard::storage::coupon_repository& repository_;
  const verifier& verifier_;
};

}  // namespace couponguard::execution
