#pragma once
#include <docket/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace docket::schema {

enum class action_severity : uint8_t { normal = 0, elevated = 1, critical = 2 };

inline constexpr auto kActionSeverityNames =
    std::array<std::pair<std::string_view, action_severity>, 3>{{
        {"normal", action_severity::normal},
        {"elevated", action_severity::elevated},
        {"critical", action_severity::critical},
    }};

constexpr std::string_view to_string(const action_severity value) {
  return to_string(value, kActionSeverityNames).value_or("normal");
}

}  // namespace docket::schema
