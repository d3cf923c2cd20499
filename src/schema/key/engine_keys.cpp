#include <couponguard/schema/key/engine_keys.hpp>

#include <couponguard/blake3/hash.hpp>
#include <couponguard/schema/encoding/scale/encoder.hpp>

namespace couponguard::schema::key {

namespace {

using key_encoder_t = couponguard::schema::encoding::encoder<
    couponguard::schema::encoding::scale_encoder_tag>;

}  // namespace

couponguard::schema::bytes_t make_prefixed_key(
    std::string_view prefix,
    const couponguard::schema::bytes_view_t& id) {
  auto key = couponguard::schema::make_bytes(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

couponguard::schema::bytes_t make_coupon_key(
    const couponguard::schema::coupon_id_t coupon_id) {
  return make_prefixed_key(kCouponKeyPrefix, key_encoder_t{}.encode(coupon_id));
}

couponguard::schema::bytes_t make_campaign_key(
    const couponguard::schema::campaign_id_t campaign_id) {
  return make_prefixed_key(kCampaignKeyPrefix,
                           key_encoder_t{}.encode(campaign_id));
}

couponguard::schema::bytes_t make_token_index_key(std::string_view token) {
  auto digest = couponguard::blake3::hash(token);
  return make_prefixed_key(kTokenIndexPrefix, digest);
}

couponguard::schema::bytes_t make_code_index_key(std::string_view coupon_code) {
  return make_prefixed_key(kCodeIndexPrefix,
                           couponguard::schema::make_bytes_view(coupon_code));
}

couponguard::schema::bytes_t make_coupon_sequence_key() {
  return couponguard::schema::make_bytes(kCouponSequenceKey);
}

}  // namespace couponguard::schema::key
