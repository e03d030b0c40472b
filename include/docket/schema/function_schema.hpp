#pragma once
#include <docket/schema/abi_type.hpp>
#include <docket/schema/primitives.hpp>

#include <optional>
#include <string>
#include <vector>

namespace docket::schema {

struct parameter_schema final {
  std::string name;
  // Type as written in the definition (`address[]`).
  std::string declared_type;
  // Element type with array suffixes removed (`address`).
  std::string base_type;
  abi_type type;

  bool operator==(const parameter_schema&) const = default;
};

struct function_schema final {
  std::string name;
  std::vector<parameter_schema> parameters;
  // Canonical signature, `transfer(address,uint256)`.
  std::string signature;
  // Absent only when no Keccak-256 digest was available at registration.
  std::optional<selector_t> selector;
  std::string description;

  bool operator==(const function_schema&) const = default;
};

}  // namespace docket::schema
