#pragma once
#include <couponguard/schema/primitives.hpp>
#include <optional>
#include <span>

namespace couponguard::schema::encoding {

// Codec selected at build time through the tag; records and storage keys go
// through the same instantiation so on-disk bytes stay comparable for
// compare-and-swap.
template <typename Library>
struct encoder {
  template <typename T>
  couponguard::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, couponguard::schema::bytes_t& out);

  template <typename T>
  std::optional<T> try_decode(const couponguard::schema::bytes_view_t& bytes);
};

}  // namespace couponguard::schema::encoding
