#pragma once

#include <couponguard/schema/primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace couponguard::crypto {

/// RFC 4648 url-safe alphabet, no padding.
std::string base64url_encode(const couponguard::schema::bytes_view_t& bytes);

/// Strict inverse of base64url_encode: rejects padding, foreign characters
/// and non-zero trailing bits, so every byte string has exactly one accepted
/// encoding.
std::optional<couponguard::schema::bytes_t> try_base64url_decode(
    std::string_view text);

}  // namespace couponguard::crypto
