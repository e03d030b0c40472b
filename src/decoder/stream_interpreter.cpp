#include <docket/decoder/stream_interpreter.hpp>
#include <docket/format/number.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <ctime>
#include <initializer_list>

namespace docket::decoder {

namespace {

constexpr auto kSecondsPerDay = 86'400;
// 9999-12-31T23:59:59Z.
constexpr auto kLatestTimestamp = std::int64_t{253'402'300'799};

schema::decoded_parameter* find(
    std::vector<schema::decoded_parameter>& parameters,
    const std::string_view name) {
  auto it =
      std::ranges::find(parameters, name, &schema::decoded_parameter::name);
  return it == std::end(parameters) ? nullptr : &*it;
}

template <typename T>
const T* value_of(const schema::decoded_parameter* parameter) {
  return parameter == nullptr ? nullptr
                              : std::get_if<T>(&parameter->raw_value.value);
}

}  // namespace

bool is_stream_creation(const std::string_view function_name) {
  return function_name == "createStream" ||
         function_name == "createAndFundStream";
}

std::optional<std::string> format_date(const schema::big_int_t& timestamp) {
  if (timestamp < 0 || timestamp > kLatestTimestamp) {
    return std::nullopt;
  }
  auto seconds =
      static_cast<std::time_t>(timestamp.convert_to<std::int64_t>());
  return fmt::format("{:%Y-%m-%d}", fmt::gmtime(seconds));
}

std::optional<std::string> interpret_stream_creation(
    const std::string_view function_name,
    std::vector<schema::decoded_parameter>& parameters,
    const format::decimals_strategy& decimals) {
  auto* recipient = find(parameters, "recipient");
  if (recipient != nullptr && recipient->base_type == "address") {
    recipient->is_recipient = true;
    recipient->recipient_role = "Stream Recipient";
  }
  if (auto* predicted = find(parameters, kPredictedStreamAddress);
      predicted != nullptr && predicted->base_type == "address") {
    predicted->is_recipient = true;
    predicted->recipient_role = "Stream Contract (for funding)";
  }

  auto token = std::optional<format::token_convention>{};
  if (auto* token_address = find(parameters, "tokenAddress");
      const auto* address = value_of<schema::address_t>(token_address)) {
    token = decimals.for_token(schema::to_string(*address));
    if (token) {
      token_address->display_value = token->symbol;
    }
  }

  auto* start = find(parameters, "startTime");
  auto* stop = find(parameters, "stopTime");
  for (auto* timestamp : {start, stop}) {
    if (const auto* value = value_of<schema::big_int_t>(timestamp)) {
      if (auto date = format_date(*value); date) {
        timestamp->display_value = std::move(*date);
      }
    }
  }

  const auto* to = value_of<schema::address_t>(recipient);
  const auto* amount =
      value_of<schema::big_int_t>(find(parameters, "tokenAmount"));
  const auto* from = value_of<schema::big_int_t>(start);
  const auto* until = value_of<schema::big_int_t>(stop);
  if (to == nullptr || amount == nullptr || from == nullptr ||
      until == nullptr) {
    return std::nullopt;
  }

  auto scale = token ? token->decimals : uint8_t{18};
  auto symbol = token ? token->symbol : std::string{"tokens"};
  auto duration = *until > *from ? schema::big_int_t{*until - *from}
                                 : schema::big_int_t{0};
  auto days =
      schema::big_int_t{(duration + (kSecondsPerDay / 2)) / kSecondsPerDay};
  auto verb = function_name == "createAndFundStream" ? "Create and fund"
                                                     : "Create";
  return fmt::format("{} {} {} stream to {} over {} days", verb,
                     format::format_scaled(*amount, scale, 4, true, true),
                     symbol,
                     schema::truncate_address(schema::to_string(*to)),
                     days.str());
}

}  // namespace docket::decoder
