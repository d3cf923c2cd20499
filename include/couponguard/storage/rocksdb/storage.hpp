#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/utilities/optimistic_transaction_db.h>
#include <rocksdb/utilities/transaction.h>
#include <spdlog/spdlog.h>
#include <couponguard/common/critical.hpp>
#include <couponguard/schema/encoding/scale/encoder.hpp>
#include <couponguard/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>

namespace couponguard::storage {

namespace detail {

inline couponguard::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const couponguard::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline bool is_conflict(const ROCKSDB_NAMESPACE::Status& status) {
  return status.IsBusy() || status.IsTryAgain();
}

}  // namespace detail

struct rocksdb_storage_tag {};

// Backed by an OptimisticTransactionDB: conditional writes read their keys
// through GetForUpdate so a concurrent commit to the same key fails ours with
// Busy instead of silently overwriting it. This holds across processes
// sharing the database, which an in-process mutex would not give us.
template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::OptimisticTransactionDB> database;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const couponguard::schema::bytes_view_t& key,
           const T& value);

  std::optional<couponguard::schema::bytes_t> get_bytes(
      const couponguard::schema::bytes_view_t& key) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const couponguard::schema::bytes_view_t& prefix) const;
  write_status_t compare_and_swap(
      const couponguard::schema::bytes_view_t& key,
      const std::optional<couponguard::schema::bytes_view_t>& expected,
      const couponguard::schema::bytes_view_t& desired) const;
  write_status_t insert_batch_if_absent(
      const std::vector<key_value_entry_t>& entries) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const couponguard::schema::bytes_view_t& key,
    const T& value) {
  if (!database) {
    couponguard::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              detail::to_slice(key),
                              detail::to_slice(encoded_value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    couponguard::common::critical("Failed to put value into RocksDB");
  }
}

}  // namespace couponguard::storage
