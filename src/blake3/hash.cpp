#include <blake3.h>
#include <couponguard/blake3/hash.hpp>

namespace couponguard::blake3 {

namespace {

couponguard::schema::hash32_t digest(const void* data, const size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  // BLAKE3_OUT_LEN
  auto output = couponguard::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

couponguard::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

couponguard::schema::hash32_t hash(
    const couponguard::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace couponguard::blake3
