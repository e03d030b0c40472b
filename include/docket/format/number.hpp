#pragma once
#include <docket/schema/primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace docket::format {

std::string group_digits(const schema::big_int_t& value);

std::string format_scaled(const schema::big_int_t& value,
                          unsigned decimals,
                          unsigned fraction_digits,
                          bool group,
                          bool trim_trailing_zeros);

std::string format_usd(const schema::big_int_t& value, unsigned decimals);

std::optional<schema::big_int_t> try_parse_uint(std::string_view text);

/// Wei amount for display: `0 ETH`, `<wei> wei` below 0.0001 ETH, otherwise
/// at most four fraction digits (`1,234.5 ETH`). Unparseable input is
/// returned unchanged.
std::string format_eth_value(std::string_view wei);

}  // namespace docket::format
