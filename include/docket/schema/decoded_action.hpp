#pragma once
#include <docket/schema/action_category.hpp>
#include <docket/schema/action_severity.hpp>
#include <docket/schema/decoded_parameter.hpp>

#include <string>
#include <vector>

namespace docket::schema {

struct decoded_action final {
  std::string target;
  std::string contract_name;
  std::string contract_description;
  bool is_known_contract{false};
  std::string value;
  std::string value_formatted;
  std::string function_name;
  std::string signature;
  std::string function_description;
  std::vector<decoded_parameter> parameters;
  std::string calldata;
  action_category category{action_category::unknown};
  action_severity severity{action_severity::normal};
  std::string summary;
  // Recipient addresses plus the target of a bare ETH transfer.
  std::vector<std::string> addresses_to_resolve;

  bool operator==(const decoded_action&) const = default;
};

}  // namespace docket::schema
