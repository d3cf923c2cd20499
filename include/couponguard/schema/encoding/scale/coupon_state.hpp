#pragma once
#include <couponguard/schema/coupon_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace couponguard::schema {

void encode(const coupon_state<1>& o, ::scale::Encoder& encoder);
void decode(coupon_state<1>& o, ::scale::Decoder& decoder);

void encode(const coupon_state<2>& o, ::scale::Encoder& encoder);
void decode(coupon_state<2>& o, ::scale::Decoder& decoder);

}  // namespace couponguard::schema
