#include <docket/abi/decoder.hpp>
#include <docket/abi/type_parser.hpp>
#include <docket/classify/recipient_classifier.hpp>
#include <docket/decoder/schema_decoder.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <iterator>
#include <string>

namespace docket::decoder {

namespace {

bool starts_with_selector(const schema::bytes_view_t& calldata,
                          const schema::selector_t& selector) {
  return calldata.size() >= selector.size() &&
         std::ranges::equal(calldata.first(selector.size()), selector);
}

}  // namespace

schema::bytes_view_t parameter_data(const schema::function_schema& function,
                                    const schema::bytes_view_t& calldata) {
  auto size = calldata.size();
  if (!function.selector) {
    if ((size % schema::kWordSize) == 4) {
      return calldata.subspan(4);
    }
    return calldata;
  }
  auto prefixed = starts_with_selector(calldata, *function.selector);
  if (prefixed && ((size - 4) % schema::kWordSize) == 0) {
    return calldata.subspan(4);
  }
  if ((size % schema::kWordSize) == 0) {
    spdlog::debug("Treating calldata for {} as parameter-only",
                  function.signature);
    return calldata;
  }
  if (prefixed) {
    return calldata.subspan(4);
  }
  return calldata;
}

schema_decoder::schema_decoder(const registry::schema_registry& registry,
                               const format::decimals_strategy& decimals)
    : registry_{registry}, decimals_{decimals}, formatter_{registry} {}

std::optional<schema_decode_result> schema_decoder::decode(
    const schema::call_descriptor& descriptor) const {
  if (!registry_.lookup(descriptor.target)) {
    return std::nullopt;
  }
  auto calldata = schema::try_from_hex(descriptor.calldata);
  if (!calldata) {
    spdlog::debug("Calldata for {} is not valid hex", descriptor.target);
    return std::nullopt;
  }
  auto bytes = schema::make_bytes_view(*calldata);

  auto function = std::optional<schema::function_schema>{};
  if (!abi::trim(descriptor.signature).empty()) {
    function = registry_.lookup_function(descriptor.target,
                                         descriptor.signature);
  } else if (bytes.size() >= 4) {
    auto selector = schema::selector_t{};
    std::ranges::copy(bytes.first(4), std::begin(selector));
    function = registry_.lookup_function_by_selector(descriptor.target,
                                                     selector);
  }
  if (!function) {
    return std::nullopt;
  }

  auto types = std::vector<schema::abi_type>{};
  types.reserve(function->parameters.size());
  std::ranges::transform(function->parameters, std::back_inserter(types),
                         &schema::parameter_schema::type);

  auto values = std::vector<schema::decoded_value>{};
  try {
    values = abi::decode(types, parameter_data(*function, bytes));
  } catch (const std::exception& e) {
    spdlog::debug("Schema decode unavailable for {} on {}: {}",
                  function->signature, descriptor.target, e.what());
    return std::nullopt;
  }

  auto result = schema_decode_result{.function = *function};
  result.parameters.reserve(values.size());
  for (std::size_t i = 0; i < values.size(); ++i) {
    const auto& parameter = function->parameters[i];
    auto name = parameter.name.empty() ? "param" + std::to_string(i)
                                       : parameter.name;
    auto recipient = classify::is_recipient(function->name, parameter.name,
                                            parameter.base_type, i);
    auto display = formatter_.format(values[i], parameter.type);
    result.parameters.push_back(schema::decoded_parameter{
        .name = std::move(name),
        .declared_type = parameter.declared_type,
        .base_type = parameter.base_type,
        .raw_value = std::move(values[i]),
        .display_value = std::move(display),
        .is_recipient = recipient,
        .recipient_role =
            recipient ? std::optional{classify::recipient_role(
                            function->name, parameter.name)}
                      : std::nullopt,
    });
  }

  format::apply_amount_conventions(decimals_, descriptor.target,
                                   function->name, result.parameters, false);
  return result;
}

}  // namespace docket::decoder
