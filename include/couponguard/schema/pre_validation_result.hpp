#pragma once

#include <couponguard/schema/primitives.hpp>

#include <optional>
#include <string>

namespace couponguard::schema {

template <uint16_t Version>
struct pre_validation_result;

template <>
struct pre_validation_result<1> final {
  uint16_t version{1};
  bool exists{};
  bool is_active{};
  bool is_expired{true};
  std::optional<campaign_id_t> campaign_id;
  std::optional<std::string> campaign_name;
  std::optional<std::string> discount_info;
};

using pre_validation_result_t = pre_validation_result<1>;

}  // namespace couponguard::schema
