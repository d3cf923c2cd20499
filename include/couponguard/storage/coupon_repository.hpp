#pragma once

#include <couponguard/schema/campaign_state.hpp>
#include <couponguard/schema/coupon_state.hpp>
#include <couponguard/schema/primitives.hpp>
#include <couponguard/storage/rocksdb/storage.hpp>

#include <optional>
#include <stdexcept>
#include <string_view>
#include <variant>
#include <vector>

namespace couponguard::storage {

/// A stored record could not be decoded, or a legacy record holds data the
/// current layout cannot represent. Distinct from any validation violation.
class corrupt_record_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// A coupon exactly as persisted, in whichever layout it was written with.
using stored_coupon_t = std::variant<couponguard::schema::coupon_state<1>,
                                     couponguard::schema::coupon_state<2>>;

couponguard::schema::coupon_id_t coupon_id_of(const stored_coupon_t& stored);

enum class slot_reservation_t : uint8_t {
  reserved = 0,
  capacity_reached = 1,
  campaign_missing = 2,
};

/// Coupon and campaign persistence over the key layout in engine_keys.hpp.
///
/// Reads upgrade legacy records on the fly. Writes of existing coupons only
/// go through compare_and_set_coupon, which is the atomicity boundary for
/// concurrent redemption.
class coupon_repository final {
 public:
  using storage_t = storage<rocksdb_storage_tag>;

  explicit coupon_repository(storage_t& storage);

  std::optional<couponguard::schema::coupon_state_t> find_by_token(
      std::string_view token) const;
  std::optional<couponguard::schema::coupon_state_t> find_by_code(
      std::string_view coupon_code) const;
  std::optional<couponguard::schema::coupon_state_t> find_by_id(
      couponguard::schema::coupon_id_t coupon_id) const;

  /// Record without upgrading, for auditing.
  std::optional<stored_coupon_t> find_stored(
      couponguard::schema::coupon_id_t coupon_id) const;
  std::vector<stored_coupon_t> list_stored() const;

  /// Every coupon in current layout, ordered by id.
  std::vector<couponguard::schema::coupon_state_t> list_coupons() const;

  /// Insert the record with its token and code indexes in one batch.
  /// `mismatch` when the id, token or code is already taken.
  write_status_t insert_coupon(const couponguard::schema::coupon_state_t& coupon);

  /// Persist a record in the legacy layout, as a migration would.
  write_status_t import_legacy(const couponguard::schema::coupon_state<1>& coupon);

  /// Replace `expected` with `desired` if the stored record still equals
  /// `expected`. Signed issuance fields may not differ between the two.
  write_status_t compare_and_set_coupon(
      const couponguard::schema::coupon_state_t& expected,
      const couponguard::schema::coupon_state_t& desired);

  couponguard::schema::coupon_id_t next_coupon_id();

  std::optional<couponguard::schema::campaign_state_t> find_campaign(
      couponguard::schema::campaign_id_t campaign_id) const;
  void save_campaign(const couponguard::schema::campaign_state_t& campaign);

  /// Atomically add to the campaign's generated/used counters. False when the
  /// campaign does not exist.
  bool increment_campaign_counters(couponguard::schema::campaign_id_t campaign_id,
                                   uint64_t generated,
                                   uint64_t used);

  /// Count one more generated coupon if the campaign is still under
  /// max_coupons. The check and the increment commit as one CAS.
  slot_reservation_t reserve_coupon_slot(
      couponguard::schema::campaign_id_t campaign_id);

  /// Give back a slot whose coupon was never stored.
  void release_coupon_slot(couponguard::schema::campaign_id_t campaign_id);

 private:
  storage_t& storage_;
};

}  // namespace couponguard::storage
