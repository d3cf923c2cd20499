#include <couponguard/schema/encoding/scale/coupon_state.hpp>
#include <couponguard/schema/encoding/scale/coupon_status.hpp>
#include <couponguard/schema/encoding/scale/discount.hpp>

#include <stdexcept>

namespace couponguard::schema {

void encode(const coupon_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.coupon_id, encoder);
  encode(o.campaign_id, encoder);
  encode(o.token, encoder);
  encode(o.token_signature, encoder);
  encode(o.coupon_code, encoder);
  encode(o.issued_at, encoder);
  encode(o.status, encoder);
  encode(o.valid_from, encoder);
  encode(o.valid_until, encoder);
  encode(o.discount_amount, encoder);
  encode(o.discount_percentage, encoder);
  encode(o.minimum_purchase_amount, encoder);
  encode(o.applicable_fuel_types, encoder);
  encode(o.applicable_stations, encoder);
  encode(o.max_uses, encoder);
  encode(o.current_uses, encoder);
  encode(o.raffle_tickets, encoder);
}

void decode(coupon_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  if (o.version != 1) {
    throw std::invalid_argument("coupon_state<1> version mismatch");
  }
  decode(o.coupon_id, decoder);
  decode(o.campaign_id, decoder);
  decode(o.token, decoder);
  decode(o.token_signature, decoder);
  decode(o.coupon_code, decoder);
  decode(o.issued_at, decoder);
  decode(o.status, decoder);
  decode(o.valid_from, decoder);
  decode(o.valid_until, decoder);
  decode(o.discount_amount, decoder);
  decode(o.discount_percentage, decoder);
  decode(o.minimum_purchase_amount, decoder);
  decode(o.applicable_fuel_types, decoder);
  decode(o.applicable_stations, decoder);
  decode(o.max_uses, decoder);
  decode(o.current_uses, decoder);
  decode(o.raffle_tickets, decoder);
}

void encode(const coupon_state<2>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.coupon_id, encoder);
  encode(o.campaign_id, encoder);
  encode(o.token, encoder);
  encode(o.token_signature, encoder);
  encode(o.coupon_code, encoder);
  encode(o.issued_at, encoder);
  encode(o.status, encoder);
  encode(o.valid_from, encoder);
  encode(o.valid_until, encoder);
  encode(o.discount, encoder);
  encode(o.minimum_purchase_amount, encoder);
  encode(o.applicable_fuel_types, encoder);
  encode(o.applicable_stations, encoder);
  encode(o.max_uses, encoder);
  encode(o.current_uses, encoder);
  encode(o.raffle_tickets, encoder);
  encode(o.updated_at, encoder);
}

void decode(coupon_state<2>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  if (o.version != 2) {
    throw std::invalid_argument("coupon_state<2> version mismatch");
  }
  decode(o.coupon_id, decoder);
  decode(o.campaign_id, decoder);
  decode(o.token, decoder);
  decode(o.token_signature, decoder);
  decode(o.coupon_code, decoder);
  decode(o.issued_at, decoder);
  decode(o.status, decoder);
  decode(o.valid_from, decoder);
  decode(o.valid_until, decoder);
  decode(o.discount, decoder);
  decode(o.minimum_purchase_amount, decoder);
  decode(o.applicable_fuel_types, decoder);
  decode(o.applicable_stations, decoder);
  decode(o.max_uses, decoder);
  decode(o.current_uses, decoder);
  decode(o.raffle_tickets, decoder);
  decode(o.updated_at, decoder);
}

}  // namespace couponguard::schema
