#pragma once
#include <couponguard/common/critical.hpp>
#include <couponguard/schema/encoding/encoder.hpp>
#include <couponguard/schema/encoding/scale/campaign_state.hpp>
#include <couponguard/schema/encoding/scale/campaign_status.hpp>
#include <couponguard/schema/encoding/scale/coupon_state.hpp>
#include <couponguard/schema/encoding/scale/coupon_status.hpp>
#include <couponguard/schema/encoding/scale/discount.hpp>
#include <couponguard/schema/encoding/scale/station_access_claims.hpp>
#include <exception>
#include <iterator>
#include <scale/scale.hpp>

namespace couponguard::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  couponguard::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, couponguard::schema::bytes_t& out);

  template <typename T>
  std::optional<T> try_decode(const couponguard::schema::bytes_view_t& bytes);
};

template <typename T>
couponguard::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    couponguard::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        couponguard::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const couponguard::schema::bytes_view_t& bytes) {
  try {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded.value());
  } catch (const std::exception& ex) {
    spdlog::debug("SCALE decode rejected input: {}", ex.what());
    return std::nullopt;
  }
}

}  // namespace couponguard::schema::encoding
