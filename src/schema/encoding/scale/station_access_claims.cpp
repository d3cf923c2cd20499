#include <couponguard/schema/encoding/scale/station_access_claims.hpp>

namespace couponguard::schema {

void encode(const station_access_claims<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.station_id, encoder);
  encode(o.dispenser_id, encoder);
  encode(o.nonce, encoder);
  encode(o.issued_at, encoder);
  encode(o.expires_at, encoder);
}

void decode(station_access_claims<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.station_id, decoder);
  decode(o.dispenser_id, decoder);
  decode(o.nonce, decoder);
  decode(o.issued_at, decoder);
  decode(o.expires_at, decoder);
}

}  // namespace couponguard::schema
