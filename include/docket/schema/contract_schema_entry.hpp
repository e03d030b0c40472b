#pragma once
#include <docket/schema/action_category.hpp>
#include <docket/schema/contract_category.hpp>
#include <docket/schema/function_schema.hpp>

#include <map>
#include <string>

namespace docket::schema {

struct contract_schema_entry final {
  // Lowercase, `0x` prefixed.
  std::string address;
  std::string display_name;
  std::string description;
  contract_category category{contract_category::unknown};
  // Category given to calls no function rule recognizes.
  action_category domain{action_category::unknown};
  // Seeded at construction and never removed by `clear_external`.
  bool builtin{false};
  std::map<std::string, function_schema> functions;
};

}  // namespace docket::schema
