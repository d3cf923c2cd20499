#pragma once

#include <couponguard/schema/integrity_issue.hpp>
#include <couponguard/schema/primitives.hpp>

#include <algorithm>
#include <vector>

namespace couponguard::schema {

template <uint16_t Version>
struct integrity_report;

template <>
struct integrity_report<1> final {
  uint16_t version{1};
  coupon_id_t coupon_id{};
  bool is_intact{true};
  std::vector<integrity_issue_t> issues;

  bool has(const integrity_issue_t issue) const {
    return std::find(std::begin(issues), std::end(issues), issue) !=
           std::end(issues);
  }
};

using integrity_report_t = integrity_report<1>;

}  // namespace couponguard::schema
