#include <couponguard/execution/time_source.hpp>

#include <chrono>

namespace couponguard::execution {

time_source_t system_time_source() {
  return [] {
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch());
    return static_cast<couponguard::schema::timestamp_milliseconds_t>(
        now.count());
  };
}

time_source_t fixed_time_source(
    const couponguard::schema::timestamp_milliseconds_t now) {
  return [now] { return now; };
}

}  // namespace couponguard::execution
