#pragma once
#include <couponguard/schema/campaign_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace couponguard::schema {

void encode(const campaign_state<1>& o, ::scale::Encoder& encoder);
void decode(campaign_state<1>& o, ::scale::Decoder& decoder);

}  // namespace couponguard::schema
