#include <couponguard/schema/encoding/scale/coupon_status.hpp>

#include <stdexcept>

namespace couponguard::schema {

void encode(const coupon_status_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(coupon_status_t& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  if (raw > static_cast<uint8_t>(coupon_status_t::cancelled)) {
    throw std::invalid_argument("unknown coupon status");
  }
  o = static_cast<coupon_status_t>(raw);
}

}  // namespace couponguard::schema
