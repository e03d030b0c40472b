#pragma once
#include <docket/schema/primitives.hpp>

#include <string>
#include <variant>
#include <vector>

namespace docket::schema {

struct decoded_value;
struct tuple_field;

using decoded_array_t = std::vector<decoded_value>;
using decoded_tuple_t = std::vector<tuple_field>;

struct decoded_value final {
  std::variant<big_int_t,
               address_t,
               bool,
               bytes_t,
               std::string,
               decoded_array_t,
               decoded_tuple_t>
      value;
};

struct tuple_field final {
  std::string name;
  decoded_value value;
};

bool operator==(const decoded_value& lhs, const decoded_value& rhs);
bool operator==(const tuple_field& lhs, const tuple_field& rhs);

}  // namespace docket::schema
