#include <docket/classify/action_classifier.hpp>
#include <docket/classify/recipient_classifier.hpp>
#include <docket/format/number.hpp>
#include <docket/registry/builtin_contracts.hpp>

#include <algorithm>
#include <array>
#include <initializer_list>

namespace docket::classify {

namespace {

using schema::action_category;
using schema::action_severity;

constexpr auto kOwnershipFunctions =
    std::array<std::string_view, 2>{"transferOwnership", "renounceOwnership"};

constexpr auto kUpgradeFunctions =
    std::array<std::string_view, 2>{"upgradeTo", "upgradeToAndCall"};

// Names with any leading underscore removed.
constexpr auto kAdminHandoverFunctions = std::array<std::string_view, 6>{
    "setPendingAdmin", "acceptAdmin",   "setPendingVetoer",
    "acceptVetoer",    "burnVetoPower", "setTimelocksAndAdmin"};

constexpr auto kStreamFunctions =
    std::array<std::string_view, 2>{"createStream", "createAndFundStream"};

constexpr auto kDebtFunctions =
    std::array<std::string_view, 2>{"sendOrRegisterDebt", "payBackDebt"};

constexpr auto kPauseFunctions =
    std::array<std::string_view, 2>{"pause", "unpause"};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& table,
              const std::string_view value) {
  return std::ranges::find(table, value) != std::end(table);
}

std::string_view strip_underscores(std::string_view name) {
  while (name.starts_with('_')) {
    name.remove_prefix(1);
  }
  return name;
}

const schema::big_int_t* amount(const schema::decoded_action& action,
                                const std::string_view name) {
  auto it = std::ranges::find(action.parameters, name,
                              &schema::decoded_parameter::name);
  if (it == std::end(action.parameters)) {
    return nullptr;
  }
  return std::get_if<schema::big_int_t>(&it->raw_value.value);
}

bool above(const schema::big_int_t* value, const schema::big_int_t& limit) {
  return value != nullptr && *value > limit;
}

bool names_token(const schema::decoded_action& action,
                 const std::string_view parameter,
                 const std::string_view token) {
  auto it = std::ranges::find(action.parameters, parameter,
                              &schema::decoded_parameter::name);
  if (it == std::end(action.parameters)) {
    return false;
  }
  const auto* address = std::get_if<schema::address_t>(&it->raw_value.value);
  return address != nullptr && schema::to_string(*address) == token;
}

// Amount of the first integer parameter named like an amount.
const schema::big_int_t* transfer_amount(
    const schema::decoded_action& action) {
  for (const auto* name : {"amount", "value", "wad", "tokenId"}) {
    if (const auto* value = amount(action, name)) {
      return value;
    }
  }
  auto integer = std::ranges::find_if(
      action.parameters, [](const schema::decoded_parameter& parameter) {
        return std::holds_alternative<schema::big_int_t>(
            parameter.raw_value.value);
      });
  if (integer == std::end(action.parameters)) {
    return nullptr;
  }
  return std::get_if<schema::big_int_t>(&integer->raw_value.value);
}

action_severity payment_severity(const schema::decoded_action& action,
                                 const std::string_view function,
                                 const config::decoder_config& config) {
  auto target = schema::normalize_address(action.target);
  auto elevated = false;
  if (contains(kDebtFunctions, function)) {
    elevated = above(amount(action, "amount"), config.elevated_usdc_payment);
  } else if (function == "sendETH") {
    elevated =
        above(amount(action, "ethToSend"), config.elevated_eth_transfer);
  } else if (function == "sendERC20") {
    elevated =
        names_token(action, "erc20Token", registry::kUsdcAddress) &&
        above(amount(action, "tokensToSend"), config.elevated_usdc_payment);
  } else if (target == registry::kUsdcAddress) {
    elevated = above(transfer_amount(action), config.elevated_usdc_payment);
  } else if (target == registry::kWethAddress) {
    elevated = above(transfer_amount(action), config.elevated_eth_transfer);
  }
  return elevated ? action_severity::elevated : action_severity::normal;
}

}  // namespace

bool is_bare_eth_transfer(const schema::decoded_action& action) {
  if (!action.function_name.empty()) {
    return false;
  }
  auto value = format::try_parse_uint(action.value);
  return value && *value > 0;
}

classification classify_action(const schema::decoded_action& action,
                               const schema::contract_schema_entry* entry,
                               const config::decoder_config& config) {
  auto value = format::try_parse_uint(action.value);
  auto carries_eth = above(value ? &*value : nullptr,
                           config.elevated_eth_transfer);
  auto escalate = [carries_eth](classification result) {
    if (carries_eth && result.severity == action_severity::normal) {
      result.severity = action_severity::elevated;
    }
    return result;
  };

  if (action.function_name.empty()) {
    if (is_bare_eth_transfer(action)) {
      return escalate({.category = action_category::payment});
    }
    return {};
  }

  auto function = strip_underscores(action.function_name);
  auto domain = entry != nullptr ? entry->domain : action_category::unknown;

  if (contains(kOwnershipFunctions, function)) {
    return {action_category::ownership, action_severity::critical};
  }
  if (contains(kUpgradeFunctions, function)) {
    return {action_category::upgrade, action_severity::critical};
  }
  if (contains(kAdminHandoverFunctions, function)) {
    return {action_category::governance_admin, action_severity::critical};
  }
  if (contains(kStreamFunctions, function)) {
    return escalate({.category = action_category::stream});
  }
  if (function == "buyETH") {
    auto elevated = above(amount(action, "tokenAmount"),
                          config.elevated_token_buyer_purchase);
    return escalate({action_category::treasury,
                     elevated ? action_severity::elevated
                              : action_severity::normal});
  }
  if (contains(kDebtFunctions, function) || is_payment_function(function) ||
      function.starts_with("send")) {
    auto target = schema::normalize_address(action.target);
    auto fungible =
        target == registry::kUsdcAddress || target == registry::kWethAddress;
    if (domain == action_category::token && !fungible) {
      return escalate({.category = action_category::token});
    }
    return escalate({action_category::payment,
                     payment_severity(action, function, config)});
  }
  if (function.starts_with("delegate")) {
    return escalate({.category = action_category::delegation});
  }
  if (function == "approve" || function == "setApprovalForAll") {
    return escalate({.category = action_category::approval});
  }
  if (function.starts_with("set") || contains(kPauseFunctions, function)) {
    auto category = domain == action_category::governance_admin
                        ? action_category::governance_admin
                        : action_category::configuration;
    return {category, action_severity::elevated};
  }
  if (function.starts_with("mint")) {
    return escalate({.category = action_category::mint});
  }
  return escalate({.category = domain});
}

}  // namespace docket::classify
