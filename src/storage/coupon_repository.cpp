#include <couponguard/schema/encoding/scale/encoder.hpp>
#include <couponguard/schema/key/engine_keys.hpp>
#include <couponguard/storage/coupon_repository.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace couponguard::storage {

namespace {

using encoder_t = couponguard::schema::encoding::encoder<
    couponguard::schema::encoding::scale_encoder_tag>;

// The version field leads every record; SCALE writes it little-endian.
std::optional<uint16_t> peek_version(
    const couponguard::schema::bytes_view_t& raw) {
  if (raw.size() < 2) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(raw[0] | (raw[1] << 8u));
}

stored_coupon_t decode_stored(const couponguard::schema::bytes_view_t& raw) {
  auto encoder = encoder_t{};
  auto version = peek_version(raw);
  if (version == 1) {
    auto legacy = encoder.try_decode<couponguard::schema::coupon_state<1>>(raw);
    if (legacy) {
      return *legacy;
    }
  } else if (version == 2) {
    auto current = encoder.try_decode<couponguard::schema::coupon_state<2>>(raw);
    if (current) {
      return *current;
    }
  }
  throw corrupt_record_error{"undecodable coupon record"};
}

couponguard::schema::coupon_state_t to_current(const stored_coupon_t& stored) {
  auto current = std::optional<couponguard::schema::coupon_state_t>{};
  std::visit(
      overloaded{[&](const couponguard::schema::coupon_state<1>& value) {
                   current = couponguard::schema::try_upgrade(value);
                 },
                 [&](const couponguard::schema::coupon_state<2>& value) {
                   current = value;
                 }},
      stored);
  if (!current) {
    throw corrupt_record_error{
        fmt::format("coupon {} has conflicting discount columns",
                    coupon_id_of(stored))};
  }
  return std::move(*current);
}

bool same_issuance(const couponguard::schema::coupon_state_t& lhs,
                   const couponguard::schema::coupon_state_t& rhs) {
  return lhs.coupon_id == rhs.coupon_id && lhs.campaign_id == rhs.campaign_id &&
         lhs.token == rhs.token && lhs.token_signature == rhs.token_signature &&
         lhs.coupon_code == rhs.coupon_code && lhs.issued_at == rhs.issued_at;
}

couponguard::schema::coupon_id_t decode_index(
    const couponguard::schema::bytes_t& raw) {
  auto id = encoder_t{}.try_decode<couponguard::schema::coupon_id_t>(raw);
  if (!id) {
    throw corrupt_record_error{"undecodable coupon index entry"};
  }
  return *id;
}

template <typename Record>
write_status_t insert_with_indexes(coupon_repository::storage_t& storage,
                                   const Record& coupon) {
  auto encoder = encoder_t{};
  auto entries = std::vector<key_value_entry_t>{
      {couponguard::schema::key::make_coupon_key(coupon.coupon_id),
       encoder.encode(coupon)},
      {couponguard::schema::key::make_token_index_key(coupon.token),
       encoder.encode(coupon.coupon_id)},
      {couponguard::schema::key::make_code_index_key(coupon.coupon_code),
       encoder.encode(coupon.coupon_id)}};
  auto status = storage.insert_batch_if_absent(entries);
  if (status != write_status_t::applied) {
    spdlog::warn("Coupon {} ('{}') not inserted: id, token or code in use",
                 coupon.coupon_id, coupon.coupon_code);
  }
  return status;
}

}  // namespace

couponguard::schema::coupon_id_t coupon_id_of(const stored_coupon_t& stored) {
  return std::visit([](const auto& value) { return value.coupon_id; }, stored);
}

coupon_repository::coupon_repository(storage_t& storage) : storage_(storage) {}

std::optional<couponguard::schema::coupon_state_t>
coupon_repository::find_by_token(std::string_view token) const {
  auto index = storage_.get_bytes(
      couponguard::schema::key::make_token_index_key(token));
  if (!index) {
    return std::nullopt;
  }
  auto coupon = find_by_id(decode_index(*index));
  if (!coupon || coupon->token != token) {
    return std::nullopt;
  }
  return coupon;
}

std::optional<couponguard::schema::coupon_state_t>
coupon_repository::find_by_code(std::string_view coupon_code) const {
  auto index = storage_.get_bytes(
      couponguard::schema::key::make_code_index_key(coupon_code));
  if (!index) {
    return std::nullopt;
  }
  return find_by_id(decode_index(*index));
}

std::optional<couponguard::schema::coupon_state_t>
coupon_repository::find_by_id(
    const couponguard::schema::coupon_id_t coupon_id) const {
  auto stored = find_stored(coupon_id);
  if (!stored) {
    return std::nullopt;
  }
  return to_current(*stored);
}

std::optional<stored_coupon_t> coupon_repository::find_stored(
    const couponguard::schema::coupon_id_t coupon_id) const {
  auto raw =
      storage_.get_bytes(couponguard::schema::key::make_coupon_key(coupon_id));
  if (!raw) {
    return std::nullopt;
  }
  return decode_stored(*raw);
}

std::vector<stored_coupon_t> coupon_repository::list_stored() const {
  auto entries = storage_.list_by_prefix(couponguard::schema::make_bytes_view(
      couponguard::schema::key::kCouponKeyPrefix));
  auto records = std::vector<stored_coupon_t>{};
  records.reserve(entries.size());
  for (const auto& [key, value] : entries) {
    records.push_back(decode_stored(value));
  }
  std::sort(std::begin(records), std::end(records),
            [](const stored_coupon_t& lhs, const stored_coupon_t& rhs) {
              return coupon_id_of(lhs) < coupon_id_of(rhs);
            });
  return records;
}

std::vector<couponguard::schema::coupon_state_t>
coupon_repository::list_coupons() const {
  auto stored = list_stored();
  auto coupons = std::vector<couponguard::schema::coupon_state_t>{};
  coupons.reserve(stored.size());
  std::transform(std::begin(stored), std::end(stored),
                 std::back_inserter(coupons), to_current);
  return coupons;
}

write_status_t coupon_repository::insert_coupon(
    const couponguard::schema::coupon_state_t& coupon) {
  return insert_with_indexes(storage_, coupon);
}

write_status_t coupon_repository::import_legacy(
    const couponguard::schema::coupon_state<1>& coupon) {
  return insert_with_indexes(storage_, coupon);
}

write_status_t coupon_repository::compare_and_set_coupon(
    const couponguard::schema::coupon_state_t& expected,
    const couponguard::schema::coupon_state_t& desired) {
  if (!same_issuance(expected, desired)) {
    spdlog::error("Refusing to rewrite signed fields of coupon {}",
                  expected.coupon_id);
    return write_status_t::mismatch;
  }
  auto key = couponguard::schema::key::make_coupon_key(expected.coupon_id);
  auto raw = storage_.get_bytes(key);
  if (!raw) {
    return write_status_t::mismatch;
  }
  // Compared by value so upgraded legacy records can be written back; the
  // swap itself is keyed on the exact bytes read.
  if (to_current(decode_stored(*raw)) != expected) {
    return write_status_t::mismatch;
  }
  auto encoded = encoder_t{}.encode(desired);
  return storage_.compare_and_swap(key, couponguard::schema::bytes_view_t{*raw},
                                   encoded);
}

couponguard::schema::coupon_id_t coupon_repository::next_coupon_id() {
  auto key = couponguard::schema::key::make_coupon_sequence_key();
  auto encoder = encoder_t{};
  while (true) {
    auto raw = storage_.get_bytes(key);
    auto current = couponguard::schema::coupon_id_t{};
    if (raw) {
      auto decoded =
          encoder.try_decode<couponguard::schema::coupon_id_t>(*raw);
      if (!decoded) {
        throw corrupt_record_error{"undecodable coupon sequence"};
      }
      current = *decoded;
    }
    auto next = current + 1;
    auto encoded = encoder.encode(next);
    auto expected = std::optional<couponguard::schema::bytes_view_t>{};
    if (raw) {
      expected = couponguard::schema::bytes_view_t{*raw};
    }
    if (storage_.compare_and_swap(key, expected, encoded) ==
        write_status_t::applied) {
      return next;
    }
  }
}

std::optional<couponguard::schema::campaign_state_t>
coupon_repository::find_campaign(
    const couponguard::schema::campaign_id_t campaign_id) const {
  auto raw = storage_.get_bytes(
      couponguard::schema::key::make_campaign_key(campaign_id));
  if (!raw) {
    return std::nullopt;
  }
  auto campaign =
      encoder_t{}.try_decode<couponguard::schema::campaign_state_t>(*raw);
  if (!campaign) {
    throw corrupt_record_error{
        fmt::format("undecodable campaign record {}", campaign_id)};
  }
  return campaign;
}

void coupon_repository::save_campaign(
    const couponguard::schema::campaign_state_t& campaign) {
  auto encoder = encoder_t{};
  auto key = couponguard::schema::key::make_campaign_key(campaign.campaign_id);
  storage_.put(encoder, key, campaign);
}

bool coupon_repository::increment_campaign_counters(
    const couponguard::schema::campaign_id_t campaign_id,
    const uint64_t generated,
    const uint64_t used) {
  auto key = couponguard::schema::key::make_campaign_key(campaign_id);
  auto encoder = encoder_t{};
  while (true) {
    auto raw = storage_.get_bytes(key);
    if (!raw) {
      return false;
    }
    auto campaign =
        encoder.try_decode<couponguard::schema::campaign_state_t>(*raw);
    if (!campaign) {
      throw corrupt_record_error{
          fmt::format("undecodable campaign record {}", campaign_id)};
    }
    campaign->generated_coupons += generated;
    campaign->used_coupons += used;
    auto encoded = encoder.encode(*campaign);
    if (storage_.compare_and_swap(key, couponguard::schema::bytes_view_t{*raw},
                                  encoded) == write_status_t::applied) {
      return true;
    }
  }
}

slot_reservation_t coupon_repository::reserve_coupon_slot(
    const couponguard::schema::campaign_id_t campaign_id) {
  auto key = couponguard::schema::key::make_campaign_key(campaign_id);
  auto encoder = encoder_t{};
  while (true) {
    auto raw = storage_.get_bytes(key);
    if (!raw) {
      return slot_reservation_t::campaign_missing;
    }
    auto campaign =
        encoder.try_decode<couponguard::schema::campaign_state_t>(*raw);
    if (!campaign) {
      throw corrupt_record_error{
          fmt::format("undecodable campaign record {}", campaign_id)};
    }
    if (campaign->max_coupons.has_value() &&
        campaign->generated_coupons >= *campaign->max_coupons) {
      return slot_reservation_t::capacity_reached;
    }
    campaign->generated_coupons += 1;
    auto encoded = encoder.encode(*campaign);
    if (storage_.compare_and_swap(key, couponguard::schema::bytes_view_t{*raw},
                                  encoded) == write_status_t::applied) {
      return slot_reservation_t::reserved;
    }
  }
}

void coupon_repository::release_coupon_slot(
    const couponguard::schema::campaign_id_t campaign_id) {
  auto key = couponguard::schema::key::make_campaign_key(campaign_id);
  auto encoder = encoder_t{};
  while (true) {
    auto raw = storage_.get_bytes(key);
    if (!raw) {
      return;
    }
    auto campaign =
        encoder.try_decode<couponguard::schema::campaign_state_t>(*raw);
    if (!campaign) {
      throw corrupt_record_error{
          fmt::format("undecodable campaign record {}", campaign_id)};
    }
    if (campaign->generated_coupons == 0) {
      return;
    }
    campaign->generated_coupons -= 1;
    auto encoded = encoder.encode(*campaign);
    if (storage_.compare_and_swap(key, couponguard::schema::bytes_view_t{*raw},
                                  encoded) == write_status_t::applied) {
      return;
    }
  }
}

}  // namespace couponguard::storage
