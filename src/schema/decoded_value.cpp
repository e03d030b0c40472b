#include <docket/schema/decoded_value.hpp>

namespace docket::schema {

bool operator==(const decoded_value& lhs, const decoded_value& rhs) {
  return lhs.value == rhs.value;
}

bool operator==(const tuple_field& lhs, const tuple_field& rhs) {
  return lhs.name == rhs.name && lhs.value == rhs.value;
}

}  // namespace docket::schema
