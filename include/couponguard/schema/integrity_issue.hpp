#pragma once

#include <couponguard/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: integrity issue.
// Structural corruption classes reported by the offline audit.
namespace couponguard::schema {

enum class integrity_issue_t : uint16_t {
  invalid_token_format = 1,
  invalid_signature = 2,
  inverted_date_range = 3,
  usage_overrun = 4,
  conflicting_discount_types = 5,
  used_up_status_mismatch = 6,
};

inline constexpr auto kIntegrityIssueMappings = std::array{
    enum_mapping_t<integrity_issue_t>{
        "invalid token format", integrity_issue_t::invalid_token_format},
    enum_mapping_t<integrity_issue_t>{
        "invalid signature", integrity_issue_t::invalid_signature},
    enum_mapping_t<integrity_issue_t>{
        "invalid date range: valid_from is after valid_until",
        integrity_issue_t::inverted_date_range},
    enum_mapping_t<integrity_issue_t>{
        "current uses exceed maximum uses", integrity_issue_t::usage_overrun},
    enum_mapping_t<integrity_issue_t>{
        "both fixed amount and percentage discount are set",
        integrity_issue_t::conflicting_discount_types},
    enum_mapping_t<integrity_issue_t>{
        "used_up status does not match usage counters",
        integrity_issue_t::used_up_status_mismatch}};

inline constexpr std::string_view to_string(const integrity_issue_t value) {
  return to_string(value, kIntegrityIssueMappings).value_or("unknown");
}

}  // namespace couponguard::schema
