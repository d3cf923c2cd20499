#include <couponguard/schema/encoding/scale/campaign_state.hpp>
#include <couponguard/schema/encoding/scale/campaign_status.hpp>
#include <couponguard/schema/encoding/scale/discount.hpp>

namespace couponguard::schema {

void encode(const campaign_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.campaign_id, encoder);
  encode(o.name, encoder);
  encode(o.status, encoder);
  encode(o.start_date, encoder);
  encode(o.end_date, encoder);
  encode(o.default_discount, encoder);
  encode(o.raffle_tickets_per_coupon, encoder);
  encode(o.max_coupons, encoder);
  encode(o.generated_coupons, encoder);
  encode(o.used_coupons, encoder);
}

void decode(campaign_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.campaign_id, decoder);
  decode(o.name, decoder);
  decode(o.status, decoder);
  decode(o.start_date, decoder);
  decode(o.end_date, decoder);
  decode(o.default_discount, decoder);
  decode(o.raffle_tickets_per_coupon, decoder);
  decode(o.max_coupons, decoder);
  decode(o.generated_coupons, decoder);
  decode(o.used_coupons, decoder);
}

}  // namespace couponguard::schema
