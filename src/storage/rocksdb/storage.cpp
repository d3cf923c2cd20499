#include <couponguard/common/critical.hpp>
#include <couponguard/storage/rocksdb/storage.hpp>

#include <algorithm>

namespace couponguard::storage {

namespace {

using transaction_ptr = std::unique_ptr<ROCKSDB_NAMESPACE::Transaction>;

transaction_ptr begin_transaction(
    ROCKSDB_NAMESPACE::OptimisticTransactionDB& database) {
  return transaction_ptr{
      database.BeginTransaction(ROCKSDB_NAMESPACE::WriteOptions{})};
}

write_status_t commit(ROCKSDB_NAMESPACE::Transaction& transaction) {
  auto status = transaction.Commit();
  if (status.ok()) {
    return write_status_t::applied;
  }
  if (detail::is_conflict(status)) {
    spdlog::debug("RocksDB commit conflict: {}", status.ToString());
    return write_status_t::conflict;
  }
  spdlog::error("Failed to commit RocksDB transaction: {}", status.ToString());
  couponguard::common::critical("Failed to commit RocksDB transaction");
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::OptimisticTransactionDB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::OptimisticTransactionDB::Open(
      options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    couponguard::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<couponguard::schema::bytes_t>
storage<rocksdb_storage_tag>::get_bytes(
    const couponguard::schema::bytes_view_t& key) const {
  if (!database) {
    couponguard::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    couponguard::common::critical("Failed to get value from RocksDB");
  }
  return couponguard::schema::make_bytes(value);
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const couponguard::schema::bytes_view_t& prefix) const {
  if (!database) {
    couponguard::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string = couponguard::schema::make_string(prefix);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    couponguard::common::critical("RocksDB iteration failed");
  }
  return entries;
}

write_status_t storage<rocksdb_storage_tag>::compare_and_swap(
    const couponguard::schema::bytes_view_t& key,
    const std::optional<couponguard::schema::bytes_view_t>& expected,
    const couponguard::schema::bytes_view_t& desired) const {
  if (!database) {
    couponguard::common::critical("RocksDB database is not initialized");
  }
  auto transaction = begin_transaction(*database);

  auto current = std::string{};
  auto status = transaction->GetForUpdate(ROCKSDB_NAMESPACE::ReadOptions{},
                                          detail::to_slice(key), &current);
  if (!status.ok() && !status.IsNotFound()) {
    if (detail::is_conflict(status)) {
      return write_status_t::conflict;
    }
    spdlog::error("Failed to read RocksDB key for update: {}",
                  status.ToString());
    couponguard::common::critical("Failed to read RocksDB key for update");
  }

  auto matches = false;
  if (status.IsNotFound()) {
    matches = !expected.has_value();
  } else if (expected.has_value()) {
    matches = std::equal(
        std::begin(*expected), std::end(*expected),
        reinterpret_cast<const uint8_t*>(current.data()),
        reinterpret_cast<const uint8_t*>(current.data()) + current.size());
  }
  // Dropping an uncommitted transaction discards it.
  if (!matches) {
    return write_status_t::mismatch;
  }

  status = transaction->Put(detail::to_slice(key), detail::to_slice(desired));
  if (!status.ok()) {
    spdlog::error("Failed to stage RocksDB write: {}", status.ToString());
    couponguard::common::critical("Failed to stage RocksDB write");
  }
  return commit(*transaction);
}

write_status_t storage<rocksdb_storage_tag>::insert_batch_if_absent(
    const std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    couponguard::common::critical("RocksDB database is not initialized");
  }
  auto transaction = begin_transaction(*database);

  for (const auto& [key, value] : entries) {
    auto current = std::string{};
    auto status = transaction->GetForUpdate(ROCKSDB_NAMESPACE::ReadOptions{},
                                            detail::to_slice(key), &current);
    if (status.ok()) {
      return write_status_t::mismatch;
    }
    if (!status.IsNotFound()) {
      if (detail::is_conflict(status)) {
        return write_status_t::conflict;
      }
      spdlog::error("Failed to read RocksDB key for insert: {}",
                    status.ToString());
      couponguard::common::critical("Failed to read RocksDB key for insert");
    }
    status = transaction->Put(detail::to_slice(key), detail::to_slice(value));
    if (!status.ok()) {
      spdlog::error("Failed to stage RocksDB insert: {}", status.ToString());
      couponguard::common::critical("Failed to stage RocksDB insert");
    }
  }
  return commit(*transaction);
}

}  // namespace couponguard::storage
