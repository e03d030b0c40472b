#include <docket/abi/decoder.hpp>
#include <docket/abi/type_parser.hpp>
#include <docket/classify/recipient_classifier.hpp>
#include <docket/crypto/keccak.hpp>
#include <docket/decoder/manual_decoder.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

namespace docket::decoder {

namespace {

struct known_names final {
  std::string_view function;
  std::array<std::string_view, 3> names;
  std::size_t count;
};

// Governance conventions for calls whose schema is unknown.
constexpr auto kKnownParameterNames = std::array<known_names, 9>{{
    {"transfer", {"recipient", "amount"}, 2},
    {"transferFrom", {"from", "to", "tokenId"}, 3},
    {"approve", {"spender", "amount"}, 2},
    {"delegate", {"delegatee"}, 1},
    {"sendOrRegisterDebt", {"account", "amount"}, 2},
    {"setPendingAdmin", {"newAdmin"}, 1},
    {"setVotingDelay", {"newVotingDelay"}, 1},
    {"setVotingPeriod", {"newVotingPeriod"}, 1},
    {"setProposalThresholdBPS", {"newProposalThresholdBPS"}, 1},
}};

std::string compact_signature(const std::string_view signature) {
  auto out = std::string{};
  out.reserve(signature.size());
  std::ranges::copy_if(signature, std::back_inserter(out), [](const char c) {
    return std::isspace(static_cast<unsigned char>(c)) == 0;
  });
  return out;
}

schema::bytes_view_t strip_selector(const schema::bytes_view_t& calldata,
                                    const std::string_view signature) {
  auto remainder = calldata.size() % schema::kWordSize;
  if (remainder == 4) {
    return calldata.subspan(4);
  }
  if (remainder == 0 || calldata.size() < 4) {
    return calldata;
  }
  auto selector = crypto::selector(compact_signature(signature));
  if (selector && std::ranges::equal(calldata.first(4), *selector)) {
    return calldata.subspan(4);
  }
  spdlog::debug("Calldata for {} is not word aligned and carries no selector",
                signature);
  return calldata;
}

schema::decoded_parameter opaque(std::string name,
                                 std::string type,
                                 const schema::bytes_view_t& word) {
  auto hex = schema::to_hex(word);
  return schema::decoded_parameter{
      .name = std::move(name),
      .declared_type = type,
      .base_type = std::move(type),
      .raw_value = schema::decoded_value{hex},
      .display_value = hex,
  };
}

}  // namespace

std::string fallback_parameter_name(const std::string_view function,
                                    const std::size_t index) {
  auto it = std::ranges::find(kKnownParameterNames, function,
                              &known_names::function);
  if (it != std::end(kKnownParameterNames) && index < it->count) {
    return std::string{it->names[index]};
  }
  return "param" + std::to_string(index);
}

manual_decoder::manual_decoder(const registry::schema_registry& registry,
                               const format::decimals_strategy& decimals)
    : decimals_{decimals}, formatter_{registry} {}

std::vector<schema::decoded_parameter> manual_decoder::decode(
    const schema::call_descriptor& descriptor,
    const std::string_view function_name) const {
  auto types = abi::split_signature_types(descriptor.signature);
  if (!types || types->empty()) {
    return {};
  }
  auto calldata = schema::try_from_hex(descriptor.calldata);
  if (!calldata || calldata->empty()) {
    return {};
  }
  auto data = strip_selector(schema::make_bytes_view(*calldata),
                             descriptor.signature);

  auto parameters = std::vector<schema::decoded_parameter>{};
  parameters.reserve(types->size());
  for (std::size_t i = 0; i < types->size(); ++i) {
    const auto& declared = (*types)[i];
    auto name = fallback_parameter_name(function_name, i);
    auto offset = i * schema::kWordSize;
    auto available =
        offset < data.size() ? data.subspan(offset) : schema::bytes_view_t{};
    if (available.size() < schema::kWordSize) {
      parameters.push_back(opaque(std::move(name), declared, available));
      continue;
    }
    auto word = available.first(schema::kWordSize);

    auto type = abi::parse_type(declared);
    auto value = std::optional<schema::decoded_value>{};
    if (type) {
      switch (type->kind) {
        case schema::abi_kind::address:
          value = schema::decoded_value{abi::to_address(word)};
          break;
        case schema::abi_kind::unsigned_integer:
          value = schema::decoded_value{abi::to_unsigned(word)};
          break;
        case schema::abi_kind::signed_integer:
          value = schema::decoded_value{abi::to_signed(word)};
          break;
        case schema::abi_kind::boolean:
          value = schema::decoded_value{std::ranges::any_of(
              word, [](const uint8_t b) { return b != 0; })};
          break;
        case schema::abi_kind::fixed_bytes:
          value = schema::decoded_value{
              schema::make_bytes(word.first(type->width))};
          break;
        default:
          break;
      }
    }
    if (!value) {
      parameters.push_back(opaque(std::move(name), declared, word));
      continue;
    }

    auto recipient =
        classify::is_recipient(function_name, name, declared, i);
    auto display = formatter_.format(*value, *type);
    parameters.push_back(schema::decoded_parameter{
        .name = name,
        .declared_type = declared,
        .base_type = declared,
        .raw_value = std::move(*value),
        .display_value = std::move(display),
        .is_recipient = recipient,
        .recipient_role =
            recipient ? std::optional{classify::recipient_role(function_name,
                                                               name)}
                      : std::nullopt,
    });
  }

  format::apply_amount_conventions(decimals_, descriptor.target, function_name,
                                   parameters, true);
  return parameters;
}

}  // namespace docket::decoder
