#include <couponguard/crypto/sign.hpp>
#include <couponguard/execution/key_provider.hpp>

#include <utility>

namespace couponguard::execution {

signing_key_provider_t make_global_signing_key_provider(
    couponguard::schema::signing_key_t key) {
  return [key = std::move(key)](couponguard::schema::campaign_id_t)
             -> std::optional<couponguard::schema::signing_key_t> {
    return key;
  };
}

verification_key_provider_t make_global_verification_key_provider(
    couponguard::schema::verification_key_t key) {
  return [key = std::move(key)](couponguard::schema::campaign_id_t)
             -> std::optional<couponguard::schema::verification_key_t> {
    return key;
  };
}

verification_key_provider_t make_derived_verification_key_provider(
    signing_key_provider_t signing) {
  return [signing = std::move(signing)](
             const couponguard::schema::campaign_id_t campaign_id)
             -> std::optional<couponguard::schema::verification_key_t> {
    if (!signing) {
      return std::nullopt;
    }
    auto key = signing(campaign_id);
    if (!key) {
      return std::nullopt;
    }
    return couponguard::crypto::verification_key_of(*key);
  };
}

}  // namespace couponguard::execution
