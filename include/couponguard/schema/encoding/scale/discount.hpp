#pragma once
#include <couponguard/schema/discount.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace couponguard::schema {

void encode(const discount_t& o, ::scale::Encoder& encoder);
void decode(discount_t& o, ::scale::Decoder& decoder);

}  // namespace couponguard::schema
