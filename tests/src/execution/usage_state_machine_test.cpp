#include <couponguard/testing/engine_fixture.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <optional>
#include <thread>
#include <vector>

using namespace couponguard::schema;

namespace {

constexpr auto kCampaignId = campaign_id_t{42};

coupon_state_t issue_with_uses(couponguard::testing::engine_fixture& fixture,
                               const std::optional<uint32_t> max_uses) {
  fixture.seed_campaign(kCampaignId);
  auto request = fixture.make_request(kCampaignId);
  request.max_uses = max_uses;
  return fixture.issue(request);
}

}  // namespace

TEST(execution_usage_state_machine, consuming_last_use_marks_used_up) {
  auto fixture = couponguard::testing::engine_fixture{"couponguard_usm_used_up"};
  auto coupon = issue_with_uses(fixture, 2);

  auto first = fixture.engine().consume_use(coupon.coupon_id);
  ASSERT_TRUE(first.success);
  EXPECT_EQ(first.coupon->current_uses, 1u);
  EXPECT_EQ(first.coupon->status, coupon_status_t::active);

  auto second = fixture.engine().consume_use(coupon.coupon_id);
  ASSERT_TRUE(second.success);
  EXPECT_EQ(second.coupon->current_uses, 2u);
  EXPECT_EQ(second.coupon->status, coupon_status_t::used_up);

  auto third = fixture.engine().consume_use(coupon.coupon_id);
  EXPECT_FALSE(third.success);
  EXPECT_FALSE(third.error.has_value());
  EXPECT_TRUE(contains(third.violations, violation_code::status_not_active));
  EXPECT_TRUE(contains(third.violations, violation_code::usage_limit_reached));
  EXPECT_EQ(fixture.repository().find_by_id(coupon.coupon_id)->current_uses,
            2u);

  auto campaign = fixture.repository().find_campaign(kCampaignId);
  ASSERT_TRUE(campaign.has_value());
  EXPECT_EQ(campaign->generated_coupons, 1u);
  EXPECT_EQ(campaign->used_coupons, 2u);
}

TEST(execution_usage_state_machine, unlimited_coupons_stay_active) {
  auto fixture =
      couponguard::testing::engine_fixture{"couponguard_usm_unlimited"};
  auto coupon = issue_with_uses(fixture, std::nullopt);
  for (auto i = 0; i < 5; ++i) {
    ASSERT_TRUE(fixture.engine().consume_use(coupon.coupon_id).success);
  }
  auto stored = fixture.repository().find_by_id(coupon.coupon_id);
  EXPECT_EQ(stored->current_uses, 5u);
  EXPECT_EQ(stored->status, coupon_status_t::active);
}

TEST(execution_usage_state_machine, cancelled_coupon_cannot_be_reactivated) {
  auto fixture = couponguard::testing::engine_fixture{"couponguard_usm_cancel"};
  auto coupon = issue_with_uses(fixture, 3);

  auto cancelled = fixture.engine().cancel(coupon.coupon_id);
  ASSERT_TRUE(cancelled.success);
  EXPECT_EQ(cancelled.coupon->status, coupon_status_t::cancelled);

  auto activated = fixture.engine().activate(coupon.coupon_id);
  EXPECT_FALSE(activated.success);
  EXPECT_EQ(activated.error, transition_error_code::terminal_status);
  EXPECT_EQ(fixture.repository().find_by_id(coupon.coupon_id)->status,
            coupon_status_t::cancelled);

  auto consumed = fixture.engine().consume_use(coupon.coupon_id);
  EXPECT_FALSE(consumed.success);
  ASSERT_EQ(consumed.violations.size(), 1u);
  EXPECT_EQ(consumed.violations[0].status, coupon_status_t::cancelled);
}

TEST(execution_usage_state_machine, deactivation_preserves_usage) {
  auto fixture =
      couponguard::testing::engine_fixture{"couponguard_usm_deactivate"};
  auto coupon = issue_with_uses(fixture, 3);
  ASSERT_TRUE(fixture.engine().consume_use(coupon.coupon_id).success);

  ASSERT_TRUE(fixture.engine().deactivate(coupon.coupon_id).success);
  auto blocked = fixture.engine().consume_use(coupon.coupon_id);
  EXPECT_FALSE(blocked.success);
  EXPECT_TRUE(contains(blocked.violations, violation_code::status_not_active));

  auto reactivated = fixture.engine().activate(coupon.coupon_id);
  ASSERT_TRUE(reactivated.success);
  EXPECT_EQ(reactivated.coupon->status, coupon_status_t::active);
  EXPECT_EQ(reactivated.coupon->current_uses, 1u);

  auto again = fixture.engine().activate(coupon.coupon_id);
  EXPECT_TRUE(again.success);
  EXPECT_FALSE(again.error.has_value());
}

TEST(execution_usage_state_machine, missing_coupon_is_reported) {
  auto fixture =
      couponguard::testing::engine_fixture{"couponguard_usm_missing"};
  auto consumed = fixture.engine().consume_use(99);
  EXPECT_FALSE(consumed.success);
  EXPECT_EQ(consumed.error, transition_error_code::coupon_missing);
  ASSERT_EQ(consumed.violations.size(), 1u);
  EXPECT_EQ(consumed.violations[0].code, violation_code::not_found);

  EXPECT_EQ(fixture.engine().cancel(99).error,
            transition_error_code::coupon_missing);
}

TEST(execution_usage_state_machine, consumption_rechecks_validity_window) {
  auto fixture =
      couponguard::testing::engine_fixture{"couponguard_usm_window"};
  auto coupon = issue_with_uses(fixture, 3);
  fixture.advance(31 * couponguard::testing::kDay);

  auto consumed = fixture.engine().consume_use(coupon.coupon_id);
  EXPECT_FALSE(consumed.success);
  ASSERT_EQ(consumed.violations.size(), 1u);
  EXPECT_EQ(consumed.violations[0].code, violation_code::expired);
}

TEST(execution_usage_state_machine, concurrent_consumers_share_last_use) {
  auto fixture =
      couponguard::testing::engine_fixture{"couponguard_usm_concurrent"};
  auto coupon = issue_with_uses(fixture, 1);

  auto successes = std::atomic<int>{0};
  auto rejections = std::atomic<int>{0};
  auto threads = std::vector<std::thread>{};
  for (auto i = 0; i < 2; ++i) {
    threads.emplace_back([&] {
      auto result = fixture.engine().consume_use(coupon.coupon_id);
      if (result.success) {
        ++successes;
      } else if (contains(result.violations,
                          violation_code::usage_limit_reached)) {
        ++rejections;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successes.load(), 1);
  EXPECT_EQ(rejections.load(), 1);
  auto stored = fixture.repository().find_by_id(coupon.coupon_id);
  EXPECT_EQ(stored->current_uses, 1u);
  EXPECT_EQ(stored->status, coupon_status_t::used_up);
}

TEST(execution_usage_state_machine, concurrent_consumers_never_exceed_limit) {
  auto fixture =
      couponguard::testing::engine_fixture{"couponguard_usm_contention"};
  auto coupon = issue_with_uses(fixture, 3);

  auto successes = std::atomic<int>{0};
  auto threads = std::vector<std::thread>{};
  for (auto i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      if (fixture.engine().consume_use(coupon.coupon_id).success) {
        ++successes;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successes.load(), 3);
  auto stored = fixture.repository().find_by_id(coupon.coupon_id);
  EXPECT_EQ(stored->current_uses, 3u);
  EXPECT_EQ(stored->status, coupon_status_t::used_up);
  EXPECT_EQ(fixture.repository().find_campaign(kCampaignId)->used_coupons, 3u);
}

TEST(execution_usage_state_machine, expiry_sweep_skips_terminal_coupons) {
  auto fixture = couponguard::testing::engine_fixture{"couponguard_usm_expire"};
  fixture.seed_campaign(kCampaignId);

  auto short_lived = fixture.make_request(kCampaignId);
  short_lived.valid_until = fixture.now() + couponguard::testing::kDay;
  auto overdue = fixture.issue(short_lived);
  auto cancelled = fixture.issue(short_lived);
  auto current = fixture.issue(fixture.make_request(kCampaignId));
  ASSERT_TRUE(fixture.engine().cancel(cancelled.coupon_id).success);

  EXPECT_EQ(fixture.engine().expire_overdue(), 0u);
  fixture.advance(2 * couponguard::testing::kDay);
  EXPECT_EQ(fixture.engine().expire_overdue(), 1u);
  EXPECT_EQ(fixture.engine().expire_overdue(), 0u);

  EXPECT_EQ(fixture.repository().find_by_id(overdue.coupon_id)->status,
            coupon_status_t::expired);
  EXPECT_EQ(fixture.repository().find_by_id(cancelled.coupon_id)->status,
            coupon_status_t::cancelled);
  EXPECT_EQ(fixture.repository().find_by_id(current.coupon_id)->status,
            coupon_status_t::active);
}
