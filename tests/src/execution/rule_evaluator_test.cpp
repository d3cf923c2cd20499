#include <couponguard/testing/engine_fixture.hpp>
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace couponguard::schema;

namespace {

constexpr auto kCampaignId = campaign_id_t{42};

coupon_state_t issue_restricted(couponguard::testing::engine_fixture& fixture) {
  fixture.seed_campaign(kCampaignId);
  auto request = fixture.make_request(kCampaignId);
  request.coupon_code = "SUMMER-01";
  request.applicable_stations = {3, 1, 2};
  request.applicable_fuel_types = {"Regular", "Premium"};
  request.minimum_purchase_amount = 2000;
  request.max_uses = 5;
  return fixture.issue(request);
}

redemption_context_t eligible_context() {
  return redemption_context_t{
      .station_id = 2, .fuel_type = "Premium", .purchase_amount = 2500};
}

}  // namespace

TEST(execution_rule_evaluator, eligible_redemption_has_no_violations) {
  auto fixture = couponguard::testing::engine_fixture{"couponguard_rules_ok"};
  auto coupon = issue_restricted(fixture);

  auto outcome =
      fixture.engine().validate_for_redemption(coupon.token, eligible_context());
  EXPECT_TRUE(outcome.found);
  EXPECT_TRUE(outcome.authenticated);
  EXPECT_TRUE(outcome.is_valid);
  EXPECT_TRUE(outcome.can_be_used);
  EXPECT_TRUE(outcome.violations.empty());
  ASSERT_TRUE(outcome.coupon.has_value());
  EXPECT_EQ(outcome.coupon->applicable_stations,
            (std::vector<station_id_t>{1, 2, 3}));
}

TEST(execution_rule_evaluator, reports_each_applicability_rule_independently) {
  auto fixture = couponguard::testing::engine_fixture{"couponguard_rules_each"};
  auto coupon = issue_restricted(fixture);

  auto context = eligible_context();
  context.station_id = 5;
  auto outcome = fixture.engine().validate_for_redemption(coupon.token, context);
  ASSERT_EQ(outcome.violations.size(), 1u);
  EXPECT_EQ(outcome.violations[0].code, violation_code::station_mismatch);
  EXPECT_EQ(outcome.violations[0].message, "coupon is not valid at station 5");
  EXPECT_FALSE(outcome.is_valid);
  EXPECT_TRUE(outcome.authenticated);

  context = eligible_context();
  context.fuel_type = "Diesel";
  outcome = fixture.engine().validate_for_redemption(coupon.token, context);
  ASSERT_EQ(outcome.violations.size(), 1u);
  EXPECT_EQ(outcome.violations[0].code, violation_code::fuel_type_mismatch);
  EXPECT_EQ(outcome.violations[0].message,
            "coupon is not valid for fuel type 'Diesel'");

  context = eligible_context();
  context.purchase_amount = 1500;
  outcome = fixture.engine().validate_for_redemption(coupon.token, context);
  ASSERT_EQ(outcome.violations.size(), 1u);
  EXPECT_EQ(outcome.violations[0].code,
            violation_code::minimum_purchase_not_met);
  EXPECT_EQ(outcome.violations[0].message,
            "minimum purchase amount of 20.00 required");
}

TEST(execution_rule_evaluator, accumulates_every_failed_rule) {
  auto fixture = couponguard::testing::engine_fixture{"couponguard_rules_all"};
  auto coupon = issue_restricted(fixture);

  auto outcome = fixture.engine().validate_for_redemption(
      coupon.token, redemption_context_t{.station_id = 5,
                                         .fuel_type = "Diesel",
                                         .purchase_amount = 1500});
  ASSERT_EQ(outcome.violations.size(), 3u);
  EXPECT_EQ(outcome.violations[0].code, violation_code::station_mismatch);
  EXPECT_EQ(outcome.violations[1].code, violation_code::fuel_type_mismatch);
  EXPECT_EQ(outcome.violations[2].code,
            violation_code::minimum_purchase_not_met);
}

TEST(execution_rule_evaluator, absent_context_skips_applicability_rules) {
  auto fixture = couponguard::testing::engine_fixture{"couponguard_rules_ctx"};
  auto coupon = issue_restricted(fixture);

  auto outcome = fixture.engine().validate_for_redemption(
      coupon.token, redemption_context_t{.purchase_amount = 2000});
  EXPECT_TRUE(outcome.is_valid);

  outcome = fixture.engine().validate_for_redemption(coupon.token,
                                                     redemption_context_t{});
  EXPECT_TRUE(outcome.is_valid);
  EXPECT_TRUE(outcome.violations.empty());

  outcome = fixture.engine().validate_for_redemption(
      coupon.token, redemption_context_t{.station_id = 2});
  EXPECT_TRUE(outcome.is_valid);
}

TEST(execution_rule_evaluator, unknown_token_is_not_found) {
  auto fixture =
      couponguard::testing::engine_fixture{"couponguard_rules_missing"};
  auto coupon = issue_restricted(fixture);

  auto tampered = coupon.token;
  tampered.back() = tampered.back() == 'A' ? 'B' : 'A';
  for (const auto& token : {tampered, std::string{"garbage"}}) {
    auto outcome =
        fixture.engine().validate_for_redemption(token, eligible_context());
    EXPECT_FALSE(outcome.found);
    EXPECT_FALSE(outcome.is_valid);
    EXPECT_FALSE(outcome.can_be_used);
    EXPECT_FALSE(outcome.coupon.has_value());
    ASSERT_EQ(outcome.violations.size(), 1u);
    EXPECT_EQ(outcome.violations[0].code, violation_code::not_found);
    EXPECT_EQ(outcome.violations[0].message, "coupon not found");
  }
}

TEST(execution_rule_evaluator, tampered_record_is_unauthenticated) {
  auto fixture =
      couponguard::testing::engine_fixture{"couponguard_rules_tampered"};
  auto coupon = issue_restricted(fixture);

  auto forged = coupon;
  forged.token_signature.back() =
      forged.token_signature.back() == 'A' ? 'B' : 'A';
  forged.status = coupon_status_t::inactive;
  fixture.overwrite_coupon(forged);

  auto outcome =
      fixture.engine().validate_for_redemption(coupon.token, eligible_context());
  EXPECT_TRUE(outcome.found);
  EXPECT_FALSE(outcome.authenticated);
  EXPECT_FALSE(outcome.is_valid);
  EXPECT_TRUE(contains(outcome.violations, violation_code::signature_invalid));
  EXPECT_TRUE(contains(outcome.violations, violation_code::status_not_active));

  forged.token_signature.clear();
  forged.status = coupon_status_t::active;
  fixture.overwrite_coupon(forged);
  outcome =
      fixture.engine().validate_for_redemption(coupon.token, eligible_context());
  ASSERT_EQ(outcome.violations.size(), 1u);
  EXPECT_EQ(outcome.violations[0].code, violation_code::signature_invalid);
  EXPECT_EQ(outcome.violations[0].message,
            "invalid signature - possible tampering detected");
}

TEST(execution_rule_evaluator, checks_validity_window_and_token_age) {
  auto options = couponguard::execution::engine_options{};
  options.max_token_age = 365 * couponguard::testing::kDay;
  auto fixture = couponguard::testing::engine_fixture{
      "couponguard_rules_window", couponguard::testing::make_hmac_key(1),
      options};
  fixture.seed_campaign(kCampaignId);
  auto request = fixture.make_request(kCampaignId);
  request.valid_from = fixture.now() + couponguard::testing::kDay;
  auto coupon = fixture.issue(request);

  auto outcome =
      fixture.engine().validate_for_redemption(coupon.token, {});
  ASSERT_EQ(outcome.violations.size(), 1u);
  EXPECT_EQ(outcome.violations[0].code, violation_code::not_yet_valid);

  fixture.advance(31 * couponguard::testing::kDay);
  outcome = fixture.engine().validate_for_redemption(coupon.token, {});
  ASSERT_EQ(outcome.violations.size(), 1u);
  EXPECT_EQ(outcome.violations[0].code, violation_code::expired);
  EXPECT_EQ(outcome.violations[0].message, "coupon has expired");
}

TEST(execution_rule_evaluator, rejects_tokens_older_than_max_age) {
  auto fixture = couponguard::testing::engine_fixture{"couponguard_rules_age"};
  fixture.seed_campaign(kCampaignId);
  auto coupon = fixture.issue(fixture.make_request(kCampaignId));

  fixture.advance(23 * couponguard::testing::kHour);
  EXPECT_TRUE(fixture.engine().validate_for_redemption(coupon.token, {}).is_valid);

  fixture.advance(2 * couponguard::testing::kHour);
  auto outcome = fixture.engine().validate_for_redemption(coupon.token, {});
  ASSERT_EQ(outcome.violations.size(), 1u);
  EXPECT_EQ(outcome.violations[0].code, violation_code::token_stale);
  EXPECT_EQ(outcome.violations[0].message, "token has expired due to age");
}

TEST(execution_rule_evaluator, reports_inactive_coupon_and_campaign) {
  auto fixture =
      couponguard::testing::engine_fixture{"couponguard_rules_inactive"};
  auto campaign = fixture.seed_campaign(kCampaignId);
  auto coupon = fixture.issue(fixture.make_request(kCampaignId));

  ASSERT_TRUE(fixture.engine().deactivate(coupon.coupon_id).success);
  campaign.status = campaign_status_t::paused;
  fixture.repository().save_campaign(campaign);

  auto outcome = fixture.engine().validate_for_redemption(coupon.token, {});
  ASSERT_EQ(outcome.violations.size(), 2u);
  EXPECT_EQ(outcome.violations[0].code, violation_code::status_not_active);
  EXPECT_EQ(outcome.violations[0].status, coupon_status_t::inactive);
  EXPECT_EQ(outcome.violations[0].message,
            "coupon is not active (status: INACTIVE)");
  EXPECT_EQ(outcome.violations[1].code, violation_code::campaign_inactive);
  EXPECT_EQ(outcome.violations[1].message, "campaign is not active");
}

TEST(execution_rule_evaluator, validates_by_code_and_in_batches) {
  auto fixture = couponguard::testing::engine_fixture{"couponguard_rules_code"};
  auto coupon = issue_restricted(fixture);

  auto by_code =
      fixture.engine().validate_by_coupon_code("SUMMER-01", eligible_context());
  EXPECT_TRUE(by_code.is_valid);
  EXPECT_FALSE(fixture.engine()
                   .validate_by_coupon_code("WINTER-01", eligible_context())
                   .found);

  auto outcomes = fixture.engine().validate_batch(
      {coupon.token, "garbage", coupon.token}, eligible_context());
  ASSERT_EQ(outcomes.size(), 3u);
  EXPECT_TRUE(outcomes[0].is_valid);
  EXPECT_FALSE(outcomes[1].found);
  EXPECT_TRUE(outcomes[2].is_valid);
}

TEST(execution_rule_evaluator, pre_validation_summarizes_without_rules) {
  auto fixture = couponguard::testing::engine_fixture{"couponguard_rules_pre"};
  fixture.seed_campaign(kCampaignId);
  auto request = fixture.make_request(kCampaignId);
  request.discount = percentage_discount_t{.basis_points = 1500};
  auto coupon = fixture.issue(request);

  auto result = fixture.engine().pre_validate(coupon.token);
  EXPECT_TRUE(result.exists);
  EXPECT_TRUE(result.is_active);
  EXPECT_FALSE(result.is_expired);
  EXPECT_EQ(result.campaign_id, kCampaignId);
  EXPECT_EQ(result.campaign_name, "Summer Fuel");
  EXPECT_EQ(result.discount_info, "percentage discount: 15%");

  auto missing = fixture.engine().pre_validate("garbage");
  EXPECT_FALSE(missing.exists);
  EXPECT_FALSE(missing.is_active);
  EXPECT_TRUE(missing.is_expired);
  EXPECT_FALSE(missing.campaign_id.has_value());
}

TEST(execution_rule_evaluator, usage_stats_track_consumption) {
  auto fixture = couponguard::testing::engine_fixture{"couponguard_rules_stats"};
  fixture.seed_campaign(kCampaignId);
  auto request = fixture.make_request(kCampaignId);
  request.max_uses = 4;
  auto coupon = fixture.issue(request);

  ASSERT_TRUE(fixture.engine().consume_use(coupon.coupon_id).success);
  auto stats = fixture.engine().usage_stats(coupon.coupon_id);
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->current_uses, 1u);
  EXPECT_EQ(stats->remaining_uses, 3u);
  EXPECT_DOUBLE_EQ(stats->usage_rate, 25.0);
  EXPECT_FALSE(stats->is_max_uses_reached);

  EXPECT_FALSE(fixture.engine().usage_stats(coupon.coupon_id + 100).has_value());
}
