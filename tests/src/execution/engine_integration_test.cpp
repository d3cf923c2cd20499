#include <couponguard/crypto/verify.hpp>
#include <couponguard/testing/engine_fixture.hpp>
#include <couponguard/token/coupon_token.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace couponguard::schema;

namespace {

constexpr auto kCampaignId = campaign_id_t{42};

}  // namespace

TEST(engine_integration, issue_validate_consume_lifecycle) {
  auto fixture =
      couponguard::testing::engine_fixture{"couponguard_engine_lifecycle"};
  fixture.seed_campaign(kCampaignId);
  auto request = fixture.make_request(kCampaignId);
  request.max_uses = 2;
  request.applicable_fuel_types = {"Regular"};

  auto issued = fixture.engine().issue_coupon(request);
  ASSERT_TRUE(issued.success);
  ASSERT_TRUE(issued.coupon.has_value());
  const auto coupon = *issued.coupon;
  EXPECT_EQ(coupon.coupon_id, 1u);
  EXPECT_EQ(coupon.status, coupon_status_t::active);
  EXPECT_EQ(coupon.discount, discount_t{fixed_amount_discount_t{.amount = 1000}});
  EXPECT_EQ(coupon.raffle_tickets, 2u);
  EXPECT_EQ(coupon.coupon_code.substr(0, 5), "SUMM-");
  EXPECT_EQ(coupon.issued_at, couponguard::testing::kBaseTime);
  EXPECT_TRUE(couponguard::token::is_well_formed(coupon.token));

  auto context = redemption_context_t{.fuel_type = "Regular"};
  for (auto use = 0; use < 2; ++use) {
    auto outcome = fixture.engine().validate_for_redemption(coupon.token, context);
    ASSERT_TRUE(outcome.can_be_used);
    ASSERT_TRUE(fixture.engine().consume_use(coupon.coupon_id).success);
  }

  auto outcome = fixture.engine().validate_for_redemption(coupon.token, context);
  EXPECT_TRUE(outcome.found);
  EXPECT_TRUE(outcome.authenticated);
  EXPECT_FALSE(outcome.is_valid);
  EXPECT_FALSE(outcome.can_be_used);
  EXPECT_TRUE(contains(outcome.violations, violation_code::status_not_active));
  EXPECT_TRUE(contains(outcome.violations, violation_code::usage_limit_reached));

  auto reports = fixture.engine().audit_all();
  ASSERT_EQ(reports.size(), 1u);
  EXPECT_TRUE(reports[0].is_intact);
}

TEST(engine_integration, ed25519_keys_sign_and_verify) {
  if (!couponguard::crypto::available()) {
    GTEST_SKIP() << "OpenSSL Ed25519 unavailable";
  }
  auto fixture = couponguard::testing::engine_fixture{
      "couponguard_engine_ed25519", couponguard::testing::make_ed25519_key(4)};
  fixture.seed_campaign(kCampaignId);
  auto coupon = fixture.issue(fixture.make_request(kCampaignId));

  EXPECT_TRUE(fixture.engine().validate_for_redemption(coupon.token, {}).is_valid);
  EXPECT_TRUE(fixture.engine().check_integrity(coupon).is_intact);
}

TEST(engine_integration, issue_rejects_unusable_campaigns) {
  auto fixture =
      couponguard::testing::engine_fixture{"couponguard_engine_campaign"};
  auto request = fixture.make_request(kCampaignId);
  EXPECT_EQ(fixture.engine().issue_coupon(request).error,
            issue_error_code::campaign_missing);

  auto campaign = fixture.seed_campaign(kCampaignId,
                                        campaign_status_t::paused);
  EXPECT_EQ(fixture.engine().issue_coupon(request).error,
            issue_error_code::campaign_inactive);

  campaign.status = campaign_status_t::active;
  campaign.end_date = fixture.now() - 1;
  fixture.repository().save_campaign(campaign);
  EXPECT_EQ(fixture.engine().issue_coupon(request).error,
            issue_error_code::campaign_inactive);

  campaign.end_date = fixture.now() + couponguard::testing::kDay;
  campaign.max_coupons = 1;
  fixture.repository().save_campaign(campaign);
  EXPECT_TRUE(fixture.engine().issue_coupon(request).success);
  auto result = fixture.engine().issue_coupon(request);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, issue_error_code::campaign_capacity_reached);
  EXPECT_EQ(fixture.repository().find_campaign(kCampaignId)->generated_coupons,
            1u);
}

TEST(engine_integration, issue_rejects_bad_requests) {
  auto fixture =
      couponguard::testing::engine_fixture{"couponguard_engine_request"};
  fixture.seed_campaign(kCampaignId);

  auto inverted = fixture.make_request(kCampaignId);
  std::swap(inverted.valid_from, inverted.valid_until);
  EXPECT_EQ(fixture.engine().issue_coupon(inverted).error,
            issue_error_code::invalid_validity_window);

  auto bad_code = fixture.make_request(kCampaignId);
  bad_code.coupon_code = "lower-case";
  EXPECT_EQ(fixture.engine().issue_coupon(bad_code).error,
            issue_error_code::invalid_coupon_code);

  auto exhausted = fixture.make_request(kCampaignId);
  exhausted.max_uses = 0u;
  EXPECT_EQ(fixture.engine().issue_coupon(exhausted).error,
            issue_error_code::invalid_usage_limit);

  auto over_percent = fixture.make_request(kCampaignId);
  over_percent.discount = percentage_discount_t{.basis_points = 20'000};
  EXPECT_EQ(fixture.engine().issue_coupon(over_percent).error,
            issue_error_code::invalid_discount);

  auto negative_amount = fixture.make_request(kCampaignId);
  negative_amount.discount = fixed_amount_discount_t{.amount = -500};
  EXPECT_EQ(fixture.engine().issue_coupon(negative_amount).error,
            issue_error_code::invalid_discount);

  auto zero_amount = fixture.make_request(kCampaignId);
  zero_amount.discount = fixed_amount_discount_t{.amount = 0};
  EXPECT_EQ(fixture.engine().issue_coupon(zero_amount).error,
            issue_error_code::invalid_discount);

  auto negative_minimum = fixture.make_request(kCampaignId);
  negative_minimum.minimum_purchase_amount = -1;
  EXPECT_EQ(fixture.engine().issue_coupon(negative_minimum).error,
            issue_error_code::invalid_minimum_purchase);

  EXPECT_TRUE(fixture.repository().list_coupons().empty());
  EXPECT_EQ(fixture.repository().find_campaign(kCampaignId)->generated_coupons,
            0u);

  auto named = fixture.make_request(kCampaignId);
  named.coupon_code = "SUMMER-01";
  EXPECT_TRUE(fixture.engine().issue_coupon(named).success);
  EXPECT_EQ(fixture.engine().issue_coupon(named).error,
            issue_error_code::coupon_code_in_use);
  EXPECT_EQ(fixture.repository().list_coupons().size(), 1u);
  EXPECT_EQ(fixture.repository().find_campaign(kCampaignId)->generated_coupons,
            1u);
}

TEST(engine_integration, issue_rejects_invalid_campaign_default_discount) {
  auto fixture =
      couponguard::testing::engine_fixture{"couponguard_engine_default"};
  auto campaign = fixture.seed_campaign(kCampaignId);
  campaign.default_discount = percentage_discount_t{.basis_points = 10'001};
  fixture.repository().save_campaign(campaign);

  auto request = fixture.make_request(kCampaignId);
  EXPECT_EQ(fixture.engine().issue_coupon(request).error,
            issue_error_code::invalid_discount);

  request.discount = percentage_discount_t{.basis_points = 10'000};
  auto issued = fixture.engine().issue_coupon(request);
  ASSERT_TRUE(issued.success);
  EXPECT_TRUE(
      fixture.engine().check_integrity(*issued.coupon).issues.empty());
}

TEST(engine_integration, concurrent_issuers_respect_campaign_capacity) {
  auto fixture =
      couponguard::testing::engine_fixture{"couponguard_engine_capacity"};
  auto campaign = fixture.seed_campaign(kCampaignId);
  campaign.max_coupons = 1;
  fixture.repository().save_campaign(campaign);

  auto successes = std::atomic<int>{0};
  auto rejections = std::atomic<int>{0};
  auto threads = std::vector<std::thread>{};
  for (auto i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      auto result =
          fixture.engine().issue_coupon(fixture.make_request(kCampaignId));
      if (result.success) {
        ++successes;
      } else if (result.error == issue_error_code::campaign_capacity_reached) {
        ++rejections;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successes.load(), 1);
  EXPECT_EQ(rejections.load(), 7);
  EXPECT_EQ(fixture.repository().list_coupons().size(), 1u);
  EXPECT_EQ(fixture.repository().find_campaign(kCampaignId)->generated_coupons,
            1u);
}

TEST(engine_integration, issue_without_signing_key_fails) {
  auto db = couponguard::testing::make_db_path("couponguard_engine_keyless");
  {
    auto storage = couponguard::storage::make_storage<
        couponguard::storage::rocksdb_storage_tag>(db);
    auto engine = couponguard::execution::engine{
        storage,
        [](campaign_id_t) { return std::optional<signing_key_t>{}; },
        couponguard::execution::make_global_verification_key_provider(
            couponguard::testing::make_hmac_key(1)),
        couponguard::execution::fixed_time_source(
            couponguard::testing::kBaseTime)};
    engine.repository().save_campaign(campaign_state_t{
        .campaign_id = kCampaignId,
        .name = "Summer Fuel",
        .status = campaign_status_t::active,
        .start_date = couponguard::testing::kBaseTime - couponguard::testing::kDay,
        .end_date = couponguard::testing::kBaseTime + couponguard::testing::kDay});

    auto result = engine.issue_coupon(issue_request_t{
        .campaign_id = kCampaignId,
        .valid_from = couponguard::testing::kBaseTime,
        .valid_until = couponguard::testing::kBaseTime + couponguard::testing::kDay});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, issue_error_code::signing_failed);
    EXPECT_TRUE(engine.repository().list_coupons().empty());
  }
  couponguard::testing::remove_path(db);
}

TEST(engine_integration, coupons_signed_with_rotated_key_fail_verification) {
  auto db = couponguard::testing::make_db_path("couponguard_engine_rotated");
  {
    auto storage = couponguard::storage::make_storage<
        couponguard::storage::rocksdb_storage_tag>(db);
    auto issuing = couponguard::execution::engine{
        storage,
        couponguard::execution::make_global_signing_key_provider(
            couponguard::testing::make_hmac_key(1)),
        couponguard::execution::make_global_verification_key_provider(
            couponguard::testing::make_hmac_key(1)),
        couponguard::execution::fixed_time_source(
            couponguard::testing::kBaseTime)};
    issuing.repository().save_campaign(campaign_state_t{
        .campaign_id = kCampaignId,
        .name = "Summer Fuel",
        .status = campaign_status_t::active,
        .start_date = couponguard::testing::kBaseTime - couponguard::testing::kDay,
        .end_date = couponguard::testing::kBaseTime + couponguard::testing::kDay});
    auto issued = issuing.issue_coupon(issue_request_t{
        .campaign_id = kCampaignId,
        .valid_from = couponguard::testing::kBaseTime,
        .valid_until = couponguard::testing::kBaseTime + couponguard::testing::kDay});
    ASSERT_TRUE(issued.success);

    auto redeeming = couponguard::execution::engine{
        storage, {},
        couponguard::execution::make_global_verification_key_provider(
            couponguard::testing::make_hmac_key(2)),
        couponguard::execution::fixed_time_source(
            couponguard::testing::kBaseTime)};
    auto outcome =
        redeeming.validate_for_redemption(issued.coupon->token, {});
    EXPECT_TRUE(outcome.found);
    EXPECT_FALSE(outcome.authenticated);
    ASSERT_EQ(outcome.violations.size(), 1u);
    EXPECT_EQ(outcome.violations[0].code, violation_code::signature_invalid);
  }
  couponguard::testing::remove_path(db);
}
