#include <couponguard/token/coupon_token.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <vector>

namespace couponguard::token {

namespace {

bool is_digit(const char c) {
  return c >= '0' && c <= '9';
}

bool is_upper_alnum(const char c) {
  return (c >= 'A' && c <= 'Z') || is_digit(c);
}

bool all_digits(std::string_view text) {
  return !text.empty() && std::all_of(std::begin(text), std::end(text), is_digit);
}

template <typename T>
std::optional<T> parse_number(std::string_view text) {
  auto value = T{};
  auto [end, error] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (error != std::errc{} || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::vector<std::string_view> split(std::string_view text, const char delimiter) {
  auto parts = std::vector<std::string_view>{};
  while (true) {
    auto position = text.find(delimiter);
    parts.push_back(text.substr(0, position));
    if (position == std::string_view::npos) {
      break;
    }
    text.remove_prefix(position + 1);
  }
  return parts;
}

}  // namespace

std::string format_token(const couponguard::schema::coupon_token_t& token) {
  return fmt::format("{}_{}_{:0{}}_{:0{}}_{}_{}_{}", token.prefix,
                     token.token_version, token.campaign_id, kMinCampaignDigits,
                     token.sequence % kSequenceModulus, kSequenceDigits,
                     format_utc_timestamp(token.issued_at), token.nonce,
                     token.coupon_code);
}

std::optional<couponguard::schema::coupon_token_t> try_parse(
    std::string_view token,
    std::string_view prefix,
    std::string_view version) {
  auto parts = split(token, '_');
  if (parts.size() != kSegmentCount) {
    return std::nullopt;
  }
  if (parts[0] != prefix || parts[1] != version) {
    return std::nullopt;
  }

  const auto& campaign = parts[2];
  if (campaign.size() < kMinCampaignDigits ||
      campaign.size() > kMaxCampaignDigits || !all_digits(campaign)) {
    return std::nullopt;
  }
  auto campaign_id = parse_number<couponguard::schema::campaign_id_t>(campaign);
  if (!campaign_id) {
    return std::nullopt;
  }

  const auto& sequence = parts[3];
  if (sequence.size() != kSequenceDigits || !all_digits(sequence)) {
    return std::nullopt;
  }
  auto sequence_value = parse_number<uint32_t>(sequence);
  if (!sequence_value) {
    return std::nullopt;
  }

  auto issued_at = try_parse_utc_timestamp(parts[4]);
  if (!issued_at) {
    return std::nullopt;
  }

  const auto& nonce = parts[5];
  if (nonce.size() != kNonceLength ||
      !std::all_of(std::begin(nonce), std::end(nonce), is_upper_alnum)) {
    return std::nullopt;
  }

  if (!is_valid_coupon_code(parts[6])) {
    return std::nullopt;
  }

  return couponguard::schema::coupon_token_t{
      .prefix = std::string{parts[0]},
      .token_version = std::string{parts[1]},
      .campaign_id = *campaign_id,
      .sequence = *sequence_value,
      .issued_at = *issued_at,
      .nonce = std::string{nonce},
      .coupon_code = std::string{parts[6]}};
}

bool is_well_formed(std::string_view token,
                    std::string_view prefix,
                    std::string_view version) {
  return try_parse(token, prefix, version).has_value();
}

bool is_valid_coupon_code(std::string_view coupon_code) {
  if (coupon_code.size() < kMinCodeLength ||
      coupon_code.size() > kMaxCodeLength) {
    return false;
  }
  return std::all_of(std::begin(coupon_code), std::end(coupon_code),
                     [](const char c) { return is_upper_alnum(c) || c == '-'; });
}

std::string format_utc_timestamp(
    const couponguard::schema::timestamp_milliseconds_t timestamp) {
  using namespace std::chrono;
  auto point = sys_time<milliseconds>{milliseconds{timestamp}};
  auto midnight = floor<days>(point);
  auto date = year_month_day{midnight};
  auto time = hh_mm_ss{floor<seconds>(point - midnight)};
  return fmt::format("{:04}{:02}{:02}{:02}{:02}{:02}",
                     static_cast<int>(date.year()),
                     static_cast<unsigned>(date.month()),
                     static_cast<unsigned>(date.day()), time.hours().count(),
                     time.minutes().count(), time.seconds().count());
}

std::optional<couponguard::schema::timestamp_milliseconds_t>
try_parse_utc_timestamp(std::string_view text) {
  using namespace std::chrono;
  if (text.size() != kTimestampDigits || !all_digits(text)) {
    return std::nullopt;
  }
  auto field = [&](const size_t offset, const size_t length) {
    return *parse_number<int>(text.substr(offset, length));
  };
  auto date = year_month_day{year{field(0, 4)},
                             month{static_cast<unsigned>(field(4, 2))},
                             day{static_cast<unsigned>(field(6, 2))}};
  auto hour = field(8, 2);
  auto minute = field(10, 2);
  auto second = field(12, 2);
  if (!date.ok() || date.year() < year{1970} || hour > 23 || minute > 59 ||
      second > 59) {
    return std::nullopt;
  }
  auto point = sys_days{date} + hours{hour} + minutes{minute} + seconds{second};
  return static_cast<couponguard::schema::timestamp_milliseconds_t>(
      duration_cast<milliseconds>(point.time_since_epoch()).count());
}

couponguard::schema::timestamp_milliseconds_t truncate_to_seconds(
    const couponguard::schema::timestamp_milliseconds_t timestamp) {
  return timestamp - (timestamp % couponguard::schema::kMillisecondsPerSecond);
}

std::string signed_message(
    std::string_view token,
    const couponguard::schema::campaign_id_t campaign_id,
    std::string_view coupon_code,
    const couponguard::schema::timestamp_milliseconds_t issued_at) {
  return fmt::format("{}|{}|{}|{}", token, campaign_id, coupon_code,
                     issued_at);
}

}  // namespace couponguard::token
