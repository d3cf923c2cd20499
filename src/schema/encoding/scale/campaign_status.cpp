#include <couponguard/schema/encoding/scale/campaign_status.hpp>

#include <stdexcept>

namespace couponguard::schema {

void encode(const campaign_status_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(campaign_status_t& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  if (raw > static_cast<uint8_t>(campaign_status_t::cancelled)) {
    throw std::invalid_argument("unknown campaign status");
  }
  o = static_cast<campaign_status_t>(raw);
}

}  // namespace couponguard::schema
