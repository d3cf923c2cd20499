#pragma once
#include <couponguard/schema/coupon_status.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace couponguard::schema {

void encode(const coupon_status_t& o, ::scale::Encoder& encoder);
void decode(coupon_status_t& o, ::scale::Decoder& decoder);

}  // namespace couponguard::schema
