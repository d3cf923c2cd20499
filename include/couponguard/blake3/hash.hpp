#pragma once
#include <couponguard/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace couponguard::blake3 {

couponguard::schema::hash32_t hash(const std::string_view& str);
couponguard::schema::hash32_t hash(const couponguard::schema::bytes_view_t& bytes);

}  // namespace couponguard::blake3
