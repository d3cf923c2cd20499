#pragma once

#include <couponguard/schema/primitives.hpp>
#include <couponguard/schema/signing_key.hpp>

namespace couponguard::crypto {

bool available();

/// Length-checked, then compared without data-dependent early exit.
bool constant_time_equals(const couponguard::schema::bytes_view_t& lhs,
                          const couponguard::schema::bytes_view_t& rhs);

/// An empty signature never verifies.
bool verify_signature(const couponguard::schema::bytes_view_t& message,
                      const couponguard::schema::verification_key_t& key,
                      const couponguard::schema::bytes_view_t& signature);

}  // namespace couponguard::crypto
