#pragma once
#include <couponguard/schema/station_access_claims.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace couponguard::schema {

void encode(const station_access_claims<1>& o, ::scale::Encoder& encoder);
void decode(station_access_claims<1>& o, ::scale::Decoder& decoder);

}  // namespace couponguard::schema
