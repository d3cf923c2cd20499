#pragma once
#include <couponguard/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace couponguard::storage {

using key_value_entry_t =
    std::pair<couponguard::schema::bytes_t, couponguard::schema::bytes_t>;

/// Outcome of a conditional write.
enum class write_status_t : uint8_t {
  applied = 0,
  // Stored value did not match the expectation; nothing was written.
  mismatch = 1,
  // Another writer committed to a key this write read; nothing was written.
  conflict = 2,
};

template <typename Library>
struct storage {
  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const couponguard::schema::bytes_view_t& key,
           const T& value);

  /// Raw stored bytes at key, or std::nullopt when missing.
  std::optional<couponguard::schema::bytes_t> get_bytes(
      const couponguard::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const couponguard::schema::bytes_view_t& prefix) const;

  /// Write desired at key only if the stored bytes equal expected
  /// (std::nullopt expects the key to be absent).
  write_status_t compare_and_swap(
      const couponguard::schema::bytes_view_t& key,
      const std::optional<couponguard::schema::bytes_view_t>& expected,
      const couponguard::schema::bytes_view_t& desired) const;

  /// Atomically write every entry, or none if any key already exists.
  write_status_t insert_batch_if_absent(
      const std::vector<key_value_entry_t>& entries) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace couponguard::storage
