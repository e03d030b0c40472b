#pragma once
#include <docket/schema/decoded_value.hpp>

#include <optional>
#include <string>

namespace docket::schema {

struct decoded_parameter final {
  std::string name;
  std::string declared_type;
  std::string base_type;
  decoded_value raw_value;
  std::string display_value;
  bool is_recipient{false};
  std::optional<std::string> recipient_role;

  bool operator==(const decoded_parameter&) const = default;
};

}  // namespace docket::schema
