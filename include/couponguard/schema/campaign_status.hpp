#pragma once

#include <couponguard/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: campaign status.
// Campaign lifecycle is administered externally; only active campaigns issue
// and redeem coupons.
namespace couponguard::schema {

enum class campaign_status_t : uint8_t {
  draft = 0,
  active = 1,
  paused = 2,
  completed = 3,
  cancelled = 4
};

inline constexpr auto kCampaignStatusMappings =
    std::array{enum_mapping_t<campaign_status_t>{
                   "DRAFT", campaign_status_t::draft},
               enum_mapping_t<campaign_status_t>{
                   "ACTIVE", campaign_status_t::active},
               enum_mapping_t<campaign_status_t>{
                   "PAUSED", campaign_status_t::paused},
               enum_mapping_t<campaign_status_t>{
                   "COMPLETED", campaign_status_t::completed},
               enum_mapping_t<campaign_status_t>{
                   "CANCELLED", campaign_status_t::cancelled}};

template <>
inline std::optional<campaign_status_t> try_from_string<campaign_status_t>(
    const std::string_view value) {
  return from_string(value, kCampaignStatusMappings);
}

inline constexpr std::string_view to_string(const campaign_status_t value) {
  return to_string(value, kCampaignStatusMappings).value_or("UNKNOWN");
}

}  // namespace couponguard::schema
