#pragma once

#include <couponguard/execution/engine_options.hpp>
#include <couponguard/execution/time_source.hpp>
#include <couponguard/schema/consume_result.hpp>
#include <couponguard/schema/coupon_status.hpp>
#include <couponguard/schema/primitives.hpp>
#include <couponguard/schema/transition_result.hpp>
#include <couponguard/storage/coupon_repository.hpp>

#include <cstdint>

namespace couponguard::execution {

/// Sole writer of coupon status and usage counters.
///
/// Every mutation is read-modify-compare-and-set against the repository and
/// is retried from a fresh read when another writer got there first, so the
/// guarantees hold across processes sharing one database.
class usage_state_machine final {
 public:
  usage_state_machine(couponguard::storage::coupon_repository& repository,
                      time_source_t now,
                      engine_options options = {});

  /// INACTIVE -> ACTIVE. Already active is a no-op success; terminal states
  /// fail.
  couponguard::schema::transition_result_t activate(
      couponguard::schema::coupon_id_t coupon_id);

  /// ACTIVE -> INACTIVE. Usage counters are left untouched.
  couponguard::schema::transition_result_t deactivate(
      couponguard::schema::coupon_id_t coupon_id);

  /// Any non-terminal state -> CANCELLED.
  couponguard::schema::transition_result_t cancel(
      couponguard::schema::coupon_id_t coupon_id);

  /// Add exactly one use. Status, validity window and usage limit are checked
  /// against the freshly read record. Reaching max_uses moves the coupon to
  /// USED_UP in the same write.
  couponguard::schema::consume_result_t consume_use(
      couponguard::schema::coupon_id_t coupon_id);

  /// Mark every non-terminal coupon whose validity ended before `now` as
  /// EXPIRED. Returns how many were changed.
  uint64_t expire_overdue(couponguard::schema::timestamp_milliseconds_t now);

 private:
  couponguard::schema::transition_result_t transition(
      couponguard::schema::coupon_id_t coupon_id,
      couponguard::schema::coupon_status_t target);

  couponguard::storage::coupon_repository& repository_;
  time_source_t now_;
  engine_options options_;
};

}  // namespace couponguard::execution
