#include <couponguard/schema/encoding/scale/discount.hpp>

#include <stdexcept>

namespace couponguard::schema {

void encode(const discount_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o.index()), encoder);
  std::visit(overloaded{[&](const no_discount_t&) {},
                        [&](const fixed_amount_discount_t& value) {
                          encode(value.amount, encoder);
                        },
                        [&](const percentage_discount_t& value) {
                          encode(value.basis_points, encoder);
                        }},
             o);
}

void decode(discount_t& o, ::scale::Decoder& decoder) {
  auto tag = uint8_t{};
  decode(tag, decoder);
  switch (tag) {
    case 0:
      o = no_discount_t{};
      return;
    case 1: {
      auto value = fixed_amount_discount_t{};
      decode(value.amount, decoder);
      o = value;
      return;
    }
    case 2: {
      auto value = percentage_discount_t{};
      decode(value.basis_points, decoder);
      o = value;
      return;
    }
    default:
      throw std::invalid_argument("unknown discount tag");
  }
}

}  // namespace couponguard::schema
