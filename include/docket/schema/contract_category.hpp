#pragma once
#include <docket/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace docket::schema {

enum class contract_category : uint8_t {
  known_internal = 0,
  known_external = 1,
  unknown = 2
};

inline constexpr auto kContractCategoryNames =
    std::array<std::pair<std::string_view, contract_category>, 3>{{
        {"known-internal", contract_category::known_internal},
        {"known-external", contract_category::known_external},
        {"unknown", contract_category::unknown},
    }};

constexpr std::string_view to_string(const contract_category value) {
  return to_string(value, kContractCategoryNames).value_or("unknown");
}

constexpr std::optional<contract_category> try_contract_category_from_string(
    const std::string_view value) {
  return from_string(value, kContractCategoryNames);
}

}  // namespace docket::schema
