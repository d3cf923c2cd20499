#pragma once

#include <couponguard/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: violation code.
// Redemption failure taxonomy: stable numeric codes so operators can tell
// corruption, forgery and replay apart from ordinary eligibility failures.
namespace couponguard::schema {

enum class violation_code : uint32_t {
  not_found = 1,
  malformed_token = 2,
  signature_invalid = 3,
  token_stale = 4,
  status_not_active = 5,
  not_yet_valid = 6,
  expired = 7,
  usage_limit_reached = 8,
  campaign_inactive = 9,
  station_mismatch = 10,
  fuel_type_mismatch = 11,
  minimum_purchase_not_met = 12,
};

inline constexpr auto kViolationCodeMappings = std::array{
    enum_mapping_t<violation_code>{"not_found",
                                                violation_code::not_found},
    enum_mapping_t<violation_code>{
        "malformed_token", violation_code::malformed_token},
    enum_mapping_t<violation_code>{
        "signature_invalid", violation_code::signature_invalid},
    enum_mapping_t<violation_code>{"token_stale",
                                                violation_code::token_stale},
    enum_mapping_t<violation_code>{
        "status_not_active", violation_code::status_not_active},
    enum_mapping_t<violation_code>{"not_yet_valid",
                                                violation_code::not_yet_valid},
    enum_mapping_t<violation_code>{"expired",
                                                violation_code::expired},
    enum_mapping_t<violation_code>{
        "usage_limit_reached", violation_code::usage_limit_reached},
    enum_mapping_t<violation_code>{
        "campaign_inactive", violation_code::campaign_inactive},
    enum_mapping_t<violation_code>{
        "station_mismatch", violation_code::station_mismatch},
    enum_mapping_t<violation_code>{
        "fuel_type_mismatch", violation_code::fuel_type_mismatch},
    enum_mapping_t<violation_code>{
        "minimum_purchase_not_met", violation_code::minimum_purchase_not_met}};

inline constexpr std::string_view to_string(const violation_code value) {
  return to_string(value, kViolationCodeMappings).value_or("unknown");
}

}  // namespace couponguard::schema
