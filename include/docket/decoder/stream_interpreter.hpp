#pragma once
#include <docket/format/decimals_strategy.hpp>
#include <docket/schema/decoded_parameter.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docket::decoder {

inline constexpr auto kPredictedStreamAddress =
    std::string_view{"predictedStreamAddress"};

bool is_stream_creation(std::string_view function_name);

/// Annotate the parameters of a stream creation call in place: recipient and
/// predicted stream roles, the token symbol, and ISO dates for the start and
/// stop timestamps. Returns the action summary when the recipient, amount and
/// both timestamps are present.
std::optional<std::string> interpret_stream_creation(
    std::string_view function_name,
    std::vector<schema::decoded_parameter>& parameters,
    const format::decimals_strategy& decimals);

std::optional<std::string> format_date(const schema::big_int_t& timestamp);

}  // namespace docket::decoder
