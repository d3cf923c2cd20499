#include <couponguard/schema/encoding/scale/encoder.hpp>
#include <couponguard/storage/rocksdb/storage.hpp>
#include <couponguard/storage/storage.hpp>
#include <couponguard/testing/common.hpp>
#include <gtest/gtest.h>

#include <iterator>
#include <optional>
#include <string>

using namespace couponguard::schema;

namespace {

using encoder_t = couponguard::schema::encoding::encoder<
    couponguard::schema::encoding::scale_encoder_tag>;

bytes_t make_key(const std::string_view text) {
  return make_bytes(text);
}

}  // namespace

TEST(storage_rocksdb, put_then_read_back_decodes_value) {
  auto db = couponguard::testing::make_db_path("couponguard_storage_put");
  {
    auto storage = couponguard::storage::make_storage<
        couponguard::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = make_key("SYS|TEST|VALUE");
    storage.put(encoder, key, uint64_t{42});

    auto raw = storage.get_bytes(key);
    ASSERT_TRUE(raw.has_value());
    auto loaded = encoder.try_decode<uint64_t>(*raw);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded.value(), 42u);
    EXPECT_FALSE(storage.get_bytes(make_key("SYS|TEST|NONE")).has_value());
  }
  couponguard::testing::remove_path(db);
}

TEST(storage_rocksdb, compare_and_swap_applies_only_on_expected_bytes) {
  auto db = couponguard::testing::make_db_path("couponguard_storage_cas");
  {
    auto storage = couponguard::storage::make_storage<
        couponguard::storage::rocksdb_storage_tag>(db);
    auto key = make_key("SYS|TEST|CAS");
    auto first = bytes_t{0x01};
    auto second = bytes_t{0x02};

    EXPECT_EQ(storage.compare_and_swap(key, std::nullopt, first),
              couponguard::storage::write_status_t::applied);
    EXPECT_EQ(storage.compare_and_swap(key, std::nullopt, second),
              couponguard::storage::write_status_t::mismatch);
    EXPECT_EQ(storage.compare_and_swap(key, bytes_view_t{second}, second),
              couponguard::storage::write_status_t::mismatch);
    EXPECT_EQ(storage.compare_and_swap(key, bytes_view_t{first}, second),
              couponguard::storage::write_status_t::applied);

    auto stored = storage.get_bytes(key);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored.value(), second);

    EXPECT_EQ(storage.compare_and_swap(make_key("SYS|TEST|MISSING"),
                                       bytes_view_t{first}, second),
              couponguard::storage::write_status_t::mismatch);
  }
  couponguard::testing::remove_path(db);
}

TEST(storage_rocksdb, batch_insert_is_all_or_nothing) {
  auto db = couponguard::testing::make_db_path("couponguard_storage_batch");
  {
    auto storage = couponguard::storage::make_storage<
        couponguard::storage::rocksdb_storage_tag>(db);
    auto taken = make_key("SYS|TEST|B");
    EXPECT_EQ(storage.compare_and_swap(taken, std::nullopt, bytes_t{0x09}),
              couponguard::storage::write_status_t::applied);

    auto entries = std::vector<couponguard::storage::key_value_entry_t>{
        {make_key("SYS|TEST|A"), bytes_t{0x01}},
        {taken, bytes_t{0x02}},
        {make_key("SYS|TEST|C"), bytes_t{0x03}}};
    EXPECT_EQ(storage.insert_batch_if_absent(entries),
              couponguard::storage::write_status_t::mismatch);
    EXPECT_FALSE(storage.get_bytes(make_key("SYS|TEST|A")).has_value());
    EXPECT_FALSE(storage.get_bytes(make_key("SYS|TEST|C")).has_value());
    EXPECT_EQ(storage.get_bytes(taken).value(), bytes_t{0x09});

    entries.erase(std::next(std::begin(entries)));
    EXPECT_EQ(storage.insert_batch_if_absent(entries),
              couponguard::storage::write_status_t::applied);
    EXPECT_EQ(storage.get_bytes(make_key("SYS|TEST|A")).value(), bytes_t{0x01});
    EXPECT_EQ(storage.get_bytes(make_key("SYS|TEST|C")).value(), bytes_t{0x03});
  }
  couponguard::testing::remove_path(db);
}

TEST(storage_rocksdb, lists_entries_by_prefix_only) {
  auto db = couponguard::testing::make_db_path("couponguard_storage_prefix");
  {
    auto storage = couponguard::storage::make_storage<
        couponguard::storage::rocksdb_storage_tag>(db);
    for (auto key : {"SYS|A|1", "SYS|A|2", "SYS|B|1"}) {
      EXPECT_EQ(storage.compare_and_swap(make_key(key), std::nullopt,
                                         make_key(key)),
                couponguard::storage::write_status_t::applied);
    }
    auto listed =
        storage.list_by_prefix(make_bytes_view(std::string_view{"SYS|A|"}));
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(make_string(listed[0].first), "SYS|A|1");
    EXPECT_EQ(make_string(listed[1].first), "SYS|A|2");
  }
  couponguard::testing::remove_path(db);
}
