#pragma once

#include <couponguard/schema/primitives.hpp>

#include <functional>

namespace couponguard::execution {

/// Milliseconds since the Unix epoch, UTC.
using time_source_t = std::function<couponguard::schema::timestamp_milliseconds_t()>;

time_source_t system_time_source();

time_source_t fixed_time_source(couponguard::schema::timestamp_milliseconds_t now);

}  // namespace couponguard::execution
