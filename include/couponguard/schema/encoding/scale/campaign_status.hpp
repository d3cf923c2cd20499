#pragma once
#include <couponguard/schema/campaign_status.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace couponguard::schema {

void encode(const campaign_status_t& o, ::scale::Encoder& encoder);
void decode(campaign_status_t& o, ::scale::Decoder& decoder);

}  // namespace couponguard::schema
