#pragma once
#include <couponguard/schema/campaign_status.hpp>
#include <couponguard/schema/discount.hpp>
#include <couponguard/schema/primitives.hpp>

#include <optional>
#include <string>

// Schema type: campaign state.
// Owned by campaign administration; the engine only reads it and bumps the
// generated/used counters.
namespace couponguard::schema {

template <uint16_t Version>
struct campaign_state;

template <>
struct campaign_state<1> final {
  uint16_t version{1};
  campaign_id_t campaign_id{};
  std::string name;
  campaign_status_t status{campaign_status_t::draft};
  timestamp_milliseconds_t start_date{};
  timestamp_milliseconds_t end_date{};
  discount_t default_discount{no_discount_t{}};
  uint32_t raffle_tickets_per_coupon{};
  std::optional<uint64_t> max_coupons;
  uint64_t generated_coupons{};
  uint64_t used_coupons{};

  bool operator==(const campaign_state<1>&) const = default;
};

using campaign_state_t = campaign_state<1>;

}  // namespace couponguard::schema
