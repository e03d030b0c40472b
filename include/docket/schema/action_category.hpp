#pragma once
#include <docket/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace docket::schema {

enum class action_category : uint8_t {
  payment = 0,
  stream = 1,
  treasury = 2,
  governance_admin = 3,
  auction = 4,
  token = 5,
  art = 6,
  rewards = 7,
  ownership = 8,
  upgrade = 9,
  configuration = 10,
  delegation = 11,
  approval = 12,
  mint = 13,
  unknown = 14
};

inline constexpr auto kActionCategoryNames =
    std::array<std::pair<std::string_view, action_category>, 15>{{
        {"payment", action_category::payment},
        {"stream", action_category::stream},
        {"treasury", action_category::treasury},
        {"governance-admin", action_category::governance_admin},
        {"auction", action_category::auction},
        {"token", action_category::token},
        {"art", action_category::art},
        {"rewards", action_category::rewards},
        {"ownership", action_category::ownership},
        {"upgrade", action_category::upgrade},
        {"configuration", action_category::configuration},
        {"delegation", action_category::delegation},
        {"approval", action_category::approval},
        {"mint", action_category::mint},
        {"unknown", action_category::unknown},
    }};

constexpr std::string_view to_string(const action_category value) {
  return to_string(value, kActionCategoryNames).value_or("unknown");
}

}  // namespace docket::schema
