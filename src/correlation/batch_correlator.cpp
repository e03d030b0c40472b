#include <docket/correlation/batch_correlator.hpp>
#include <docket/decoder/stream_interpreter.hpp>
#include <docket/decoder/summary.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <string>

namespace docket::correlation {

namespace {

constexpr auto kRecipientNames =
    std::array<std::string_view, 3>{"recipient", "account", "to"};

bool is_funding_candidate(const schema::decoded_action& action) {
  return (action.function_name == "transfer" &&
          action.category == schema::action_category::payment) ||
         action.function_name == "sendOrRegisterDebt";
}

schema::decoded_parameter* recipient_parameter(schema::decoded_action& action) {
  auto it = std::ranges::find_if(action.parameters,
                                 &schema::decoded_parameter::is_recipient);
  if (it != std::end(action.parameters)) {
    return &*it;
  }
  for (const auto& name : kRecipientNames) {
    it = std::ranges::find(action.parameters, name,
                           &schema::decoded_parameter::name);
    if (it != std::end(action.parameters)) {
      return &*it;
    }
  }
  return nullptr;
}

std::string funding_amount(const schema::decoded_action& action) {
  auto it = std::ranges::find(action.parameters, "amount",
                              &schema::decoded_parameter::name);
  if (it == std::end(action.parameters) && action.parameters.size() > 1) {
    it = std::next(std::begin(action.parameters));
  }
  if (it == std::end(action.parameters)) {
    return "funds";
  }
  return std::string{decoder::short_amount(it->display_value)};
}

}  // namespace

std::map<std::string, std::size_t> scan_stream_creations(
    const std::vector<schema::decoded_action>& actions) {
  auto out = std::map<std::string, std::size_t>{};
  for (std::size_t i = 0; i < actions.size(); ++i) {
    if (!decoder::is_stream_creation(actions[i].function_name)) {
      continue;
    }
    const auto& parameters = actions[i].parameters;
    auto it = std::ranges::find(parameters, decoder::kPredictedStreamAddress,
                                &schema::decoded_parameter::name);
    if (it == std::end(parameters)) {
      continue;
    }
    if (const auto* address =
            std::get_if<schema::address_t>(&it->raw_value.value)) {
      out.insert_or_assign(schema::to_string(*address), i);
    }
  }
  return out;
}

std::vector<schema::decoded_action> correlate(
    std::vector<schema::decoded_action> actions) {
  auto streams = scan_stream_creations(actions);
  if (streams.empty()) {
    return actions;
  }

  for (auto& action : actions) {
    if (!is_funding_candidate(action)) {
      continue;
    }
    auto* recipient = recipient_parameter(action);
    if (recipient == nullptr) {
      continue;
    }
    const auto* address =
        std::get_if<schema::address_t>(&recipient->raw_value.value);
    if (address == nullptr) {
      continue;
    }
    auto stream = streams.find(schema::to_string(*address));
    if (stream == std::end(streams)) {
      continue;
    }

    auto number = stream->second + 1;
    spdlog::debug("Action funding stream created by action #{}", number);
    action.category = schema::action_category::stream;
    action.function_description = "Fund payment stream";
    action.summary =
        fmt::format("Fund stream #{} with {}", number, funding_amount(action));
    recipient->recipient_role =
        fmt::format("Stream Contract (funding action #{})", number);
  }
  return actions;
}

}  // namespace docket::correlation
