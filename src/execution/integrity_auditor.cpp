#include <couponguard/execution/integrity_auditor.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

using namespace couponguard::schema;

namespace couponguard::execution {

namespace {

// Only the signed issuance fields matter for signature verification.
coupon_state_t issuance_fields(const coupon_state<1>& legacy) {
  return coupon_state_t{.coupon_id = legacy.coupon_id,
                        .campaign_id = legacy.campaign_id,
                        .token = legacy.token,
                        .token_signature = legacy.token_signature,
                        .coupon_code = legacy.coupon_code,
                        .issued_at = legacy.issued_at};
}

template <typename Record>
void check_common(const Record& coupon, integrity_report_t& report) {
  if (coupon.valid_from > coupon.valid_until) {
    report.issues.push_back(integrity_issue_t::inverted_date_range);
  }
  if (coupon.max_uses.has_value() && coupon.current_uses > *coupon.max_uses) {
    report.issues.push_back(integrity_issue_t::usage_overrun);
  }
  auto exhausted = coupon.max_uses.has_value() &&
                   coupon.current_uses == *coupon.max_uses;
  auto used_up = coupon.status == coupon_status_t::used_up;
  auto counters_irrelevant = coupon.status == coupon_status_t::expired ||
                             coupon.status == coupon_status_t::cancelled;
  if ((used_up && !exhausted) || (!used_up && exhausted && !counters_irrelevant)) {
    report.issues.push_back(integrity_issue_t::used_up_status_mismatch);
  }
}

void finish(integrity_report_t& report) {
  report.is_intact = report.issues.empty();
  if (!report.is_intact) {
    spdlog::warn("Coupon {} failed integrity audit with {} issue(s), first: {}",
                 report.coupon_id, report.issues.size(),
                 to_string(report.issues.front()));
  }
}

}  // namespace

integrity_auditor::integrity_auditor(
    const couponguard::storage::coupon_repository& repository,
    const verifier& token_verifier)
    : repository_(repository), verifier_(token_verifier) {}

integrity_report_t integrity_auditor::check_integrity(
    const coupon_state_t& coupon) const {
  auto report = integrity_report_t{.coupon_id = coupon.coupon_id};
  if (!verifier_.is_well_formed(coupon.token)) {
    report.issues.push_back(integrity_issue_t::invalid_token_format);
  }
  if (!verifier_.verify_signature(coupon.token, coupon.token_signature,
                                  coupon)) {
    report.issues.push_back(integrity_issue_t::invalid_signature);
  }
  check_common(coupon, report);
  finish(report);
  return report;
}

integrity_report_t integrity_auditor::check_integrity(
    const coupon_state<1>& coupon) const {
  auto report = integrity_report_t{.coupon_id = coupon.coupon_id};
  if (!verifier_.is_well_formed(coupon.token)) {
    report.issues.push_back(integrity_issue_t::invalid_token_format);
  }
  if (!verifier_.verify_signature(coupon.token, coupon.token_signature,
                                  issuance_fields(coupon))) {
    report.issues.push_back(integrity_issue_t::invalid_signature);
  }
  check_common(coupon, report);
  if (coupon.discount_amount.has_value() &&
      coupon.discount_percentage.has_value()) {
    report.issues.push_back(integrity_issue_t::conflicting_discount_types);
  }
  finish(report);
  return report;
}

integrity_report_t integrity_auditor::check_integrity(
    const couponguard::storage::stored_coupon_t& coupon) const {
  return std::visit(
      [this](const auto& value) { return check_integrity(value); }, coupon);
}

std::vector<integrity_report_t> integrity_auditor::audit_all() const {
  auto reports = std::vector<integrity_report_t>{};
  for (const auto& stored : repository_.list_stored()) {
    reports.push_back(check_integrity(stored));
  }
  auto failed = std::count_if(
      std::begin(reports), std::end(reports),
      [](const integrity_report_t& report) { return !report.is_intact; });
  spdlog::info("Integrity audit checked {} coupon(s), {} with issues",
               reports.size(), failed);
  return reports;
}

}  // namespace couponguard::execution
