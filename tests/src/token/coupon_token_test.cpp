#include <couponguard/testing/common.hpp>
#include <couponguard/token/coupon_token.hpp>
#include <gtest/gtest.h>

#include <string>

using namespace couponguard::schema;

namespace {

coupon_token_t make_token() {
  return coupon_token_t{.prefix = "GSL",
                        .token_version = "v1",
                        .campaign_id = 42,
                        .sequence = 31337,
                        .issued_at = couponguard::testing::kBaseTime,
                        .nonce = "K3Q9Z0AB",
                        .coupon_code = "SUMMER-2025"};
}

}  // namespace

TEST(token_coupon, formats_padded_segments) {
  EXPECT_EQ(couponguard::token::format_token(make_token()),
            "GSL_v1_000042_00031337_20250115120000_K3Q9Z0AB_SUMMER-2025");
}

TEST(token_coupon, parses_what_it_formats) {
  auto text = couponguard::token::format_token(make_token());
  auto parsed = couponguard::token::try_parse(text);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->campaign_id, 42u);
  EXPECT_EQ(parsed->sequence, 31337u);
  EXPECT_EQ(parsed->issued_at, couponguard::testing::kBaseTime);
  EXPECT_EQ(parsed->nonce, "K3Q9Z0AB");
  EXPECT_EQ(parsed->coupon_code, "SUMMER-2025");
}

TEST(token_coupon, accepts_campaign_ids_wider_than_six_digits) {
  auto token = make_token();
  token.campaign_id = 12345678;
  auto text = couponguard::token::format_token(token);
  EXPECT_NE(text.find("_12345678_"), std::string::npos);
  auto parsed = couponguard::token::try_parse(text);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->campaign_id, 12345678u);
}

TEST(token_coupon, rejects_malformed_tokens) {
  const auto malformed = {
      "",
      "GSL_v1_000042_00031337_20250115120000_K3Q9Z0AB",
      "XYZ_v1_000042_00031337_20250115120000_K3Q9Z0AB_SUMMER-2025",
      "GSL_v2_000042_00031337_20250115120000_K3Q9Z0AB_SUMMER-2025",
      "GSL_v1_00042_00031337_20250115120000_K3Q9Z0AB_SUMMER-2025",
      "GSL_v1_000042_0031337_20250115120000_K3Q9Z0AB_SUMMER-2025",
      "GSL_v1_000042_00031337_20251315120000_K3Q9Z0AB_SUMMER-2025",
      "GSL_v1_000042_00031337_20250115250000_K3Q9Z0AB_SUMMER-2025",
      "GSL_v1_000042_00031337_20250115120000_k3q9z0ab_SUMMER-2025",
      "GSL_v1_000042_00031337_20250115120000_K3Q9Z0A_SUMMER-2025",
      "GSL_v1_000042_00031337_20250115120000_K3Q9Z0AB_SUM",
      "GSL_v1_000042_00031337_20250115120000_K3Q9Z0AB_summer-2025",
      "GSL_v1_000042_00031337_20250115120000_K3Q9Z0AB_SUMMER_2025",
      "GSL_v1_0000A2_00031337_20250115120000_K3Q9Z0AB_SUMMER-2025"};
  for (auto token : malformed) {
    EXPECT_FALSE(couponguard::token::is_well_formed(token)) << token;
  }
}

TEST(token_coupon, honours_configured_prefix_and_version) {
  auto token = make_token();
  token.prefix = "ACME";
  token.token_version = "v3";
  auto text = couponguard::token::format_token(token);
  EXPECT_FALSE(couponguard::token::is_well_formed(text));
  EXPECT_TRUE(couponguard::token::is_well_formed(text, "ACME", "v3"));
}

TEST(token_coupon, validates_coupon_codes) {
  EXPECT_TRUE(couponguard::token::is_valid_coupon_code("ABC123"));
  EXPECT_TRUE(couponguard::token::is_valid_coupon_code("SUMM-7Q2K9X"));
  EXPECT_FALSE(couponguard::token::is_valid_coupon_code("ABC12"));
  EXPECT_FALSE(couponguard::token::is_valid_coupon_code("abc123"));
  EXPECT_FALSE(couponguard::token::is_valid_coupon_code(std::string(51, 'A')));
  EXPECT_TRUE(couponguard::token::is_valid_coupon_code(std::string(50, 'A')));
}

TEST(token_coupon, timestamps_are_whole_second_utc) {
  EXPECT_EQ(couponguard::token::format_utc_timestamp(0), "19700101000000");
  EXPECT_EQ(couponguard::token::format_utc_timestamp(
                couponguard::testing::kBaseTime + 999),
            "20250115120000");
  EXPECT_EQ(couponguard::token::try_parse_utc_timestamp("20240229235959"),
            1'709'251'199'000u);
  EXPECT_FALSE(
      couponguard::token::try_parse_utc_timestamp("20230229000000").has_value());
  EXPECT_EQ(couponguard::token::truncate_to_seconds(1'736'942'400'789),
            1'736'942'400'000u);
}

TEST(token_coupon, signed_message_binds_record_fields) {
  EXPECT_EQ(couponguard::token::signed_message("TOKEN", 42, "SUMMER-2025",
                                               1'736'942'400'000),
            "TOKEN|42|SUMMER-2025|1736942400000");
}
