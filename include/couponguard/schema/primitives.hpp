#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace couponguard::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using coupon_id_t = uint64_t;
using campaign_id_t = uint64_t;
using station_id_t = uint64_t;
// Monetary values are carried in minor units (cents).
using amount_t = int64_t;
// Percentages are carried in basis points (1500 == 15%).
using basis_points_t = uint32_t;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

inline constexpr auto kMillisecondsPerSecond = duration_milliseconds_t{1000};
inline constexpr auto kMillisecondsPerHour =
    duration_milliseconds_t{60 * 60 * 1000};
inline constexpr auto kMillisecondsPerDay = 24 * kMillisecondsPerHour;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// Render minor units as a fixed two-decimal string ("1050" -> "10.50").
std::string format_amount(amount_t amount);

/// Render basis points as a percentage without trailing zeros ("1250" ->
/// "12.5").
std::string format_percentage(basis_points_t basis_points);

}  // namespace couponguard::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
