#pragma once
#include <docket/schema/decoded_action.hpp>

#include <string>
#include <string_view>

namespace docket::decoder {

/// One-line description of a decoded action, picked by function name:
/// transfers, approvals, delegation, debt registration, `set*` admin setters,
/// `mint`/`withdraw`/`deposit` families and bare ETH transfers have their own
/// templates; anything else reads `Call <fn>() on <contract>`.
std::string describe_action(const schema::decoded_action& action);

std::string_view short_amount(std::string_view display);

}  // namespace docket::decoder
