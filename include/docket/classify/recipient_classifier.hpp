#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace docket::classify {

/// True when an address typed parameter denotes a payment, delegation or
/// ownership destination: either its position is listed for a well-known
/// function shape or its name is in the recipient vocabulary (case
/// insensitive). `base_type` must be `address`; `address[]` parameters pass
/// their element type.
bool is_recipient(std::string_view function_name,
                  std::string_view parameter_name,
                  std::string_view base_type,
                  std::size_t index);

std::string recipient_role(std::string_view function_name,
                           std::string_view parameter_name);

bool is_payment_function(std::string_view function_name);
bool is_delegation_function(std::string_view function_name);

}  // namespace docket::classify
