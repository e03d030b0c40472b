#include <docket/abi/type_parser.hpp>
#include <docket/classify/action_classifier.hpp>
#include <docket/decoder/action_decoder.hpp>
#include <docket/decoder/stream_interpreter.hpp>
#include <docket/decoder/summary.hpp>
#include <docket/format/number.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace docket::decoder {

namespace {

void add_address(std::vector<std::string>& out, std::string address) {
  if (std::ranges::find(out, address) == std::end(out)) {
    out.push_back(std::move(address));
  }
}

void collect_addresses(const schema::decoded_value& value,
                       std::vector<std::string>& out) {
  if (const auto* address = std::get_if<schema::address_t>(&value.value)) {
    add_address(out, schema::to_string(*address));
  } else if (const auto* elements =
                 std::get_if<schema::decoded_array_t>(&value.value)) {
    for (const auto& element : *elements) {
      collect_addresses(element, out);
    }
  }
}

std::vector<std::string> addresses_to_resolve(
    const schema::decoded_action& action) {
  auto out = std::vector<std::string>{};
  for (const auto& parameter : action.parameters) {
    if (parameter.is_recipient) {
      collect_addresses(parameter.raw_value, out);
    }
  }
  if (classify::is_bare_eth_transfer(action)) {
    add_address(out, schema::normalize_address(action.target));
  }
  return out;
}

std::string describe_function(const schema::decoded_action& action) {
  if (classify::is_bare_eth_transfer(action)) {
    return "Transfer ETH";
  }
  if (action.function_name.empty()) {
    return "No function call";
  }
  return fmt::format("Call {} on {}", action.function_name,
                     action.contract_name);
}

}  // namespace

action_decoder::action_decoder(const registry::schema_registry& registry,
                               config::decoder_config config)
    : registry_{registry},
      config_{std::move(config)},
      decimals_{format::decimals_strategy::from_config(config_)},
      schema_decoder_{registry_, decimals_},
      manual_decoder_{registry_, decimals_} {}

const registry::schema_registry& action_decoder::registry() const {
  return registry_;
}

const config::decoder_config& action_decoder::config() const {
  return config_;
}

schema::decoded_action action_decoder::decode(
    const schema::call_descriptor& descriptor) const {
  try {
    return decode_unchecked(descriptor);
  } catch (const std::exception& e) {
    spdlog::error("Failed to decode call to {}: {}", descriptor.target,
                  e.what());
  }
  auto contract_name = schema::truncate_address(descriptor.target);
  auto summary = fmt::format("Call to {}", contract_name);
  return schema::decoded_action{
      .target = descriptor.target,
      .contract_name = std::move(contract_name),
      .contract_description = "Unknown contract",
      .value = descriptor.value,
      .value_formatted = descriptor.value,
      .signature = descriptor.signature,
      .calldata = descriptor.calldata,
      .summary = std::move(summary),
  };
}

schema::decoded_action action_decoder::decode_unchecked(
    const schema::call_descriptor& descriptor) const {
  auto action = schema::decoded_action{
      .target = descriptor.target,
      .value = descriptor.value,
      .value_formatted = format::format_eth_value(descriptor.value),
      .function_name = abi::function_name_of(descriptor.signature),
      .signature = descriptor.signature,
      .calldata = descriptor.calldata,
  };

  auto entry = registry_.lookup(descriptor.target);
  if (entry) {
    action.contract_name = entry->display_name;
    action.contract_description = entry->description;
    action.is_known_contract = true;
  } else {
    action.contract_name = schema::truncate_address(descriptor.target);
    action.contract_description = "Unknown contract";
  }

  if (auto decoded = schema_decoder_.decode(descriptor); decoded) {
    action.function_name = decoded->function.name;
    if (abi::trim(action.signature).empty()) {
      action.signature = decoded->function.signature;
    }
    action.function_description = decoded->function.description;
    action.parameters = std::move(decoded->parameters);
  } else {
    action.parameters =
        manual_decoder_.decode(descriptor, action.function_name);
  }

  auto stream_summary = std::optional<std::string>{};
  if (is_stream_creation(action.function_name)) {
    stream_summary = interpret_stream_creation(action.function_name,
                                               action.parameters, decimals_);
  }

  auto classification =
      classify::classify_action(action, entry.get(), config_);
  action.category = classification.category;
  action.severity = classification.severity;
  if (action.function_description.empty()) {
    action.function_description = describe_function(action);
  }
  action.summary = stream_summary ? std::move(*stream_summary)
                                  : describe_action(action);
  action.addresses_to_resolve = addresses_to_resolve(action);
  return action;
}

}  // namespace docket::decoder
