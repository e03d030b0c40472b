#include <docket/classify/action_classifier.hpp>
#include <docket/decoder/summary.hpp>
#include <docket/format/number.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <initializer_list>
#include <string>

namespace docket::decoder {

namespace {

using parameters_t = std::vector<schema::decoded_parameter>;

const schema::decoded_parameter* named(const parameters_t& parameters,
                                       const std::string_view name) {
  auto it =
      std::ranges::find(parameters, name, &schema::decoded_parameter::name);
  return it == std::end(parameters) ? nullptr : &*it;
}

const schema::decoded_parameter* at(const parameters_t& parameters,
                                    const std::size_t index) {
  return index < parameters.size() ? &parameters[index] : nullptr;
}

const schema::decoded_parameter* first_recipient(
    const parameters_t& parameters) {
  auto it = std::ranges::find_if(parameters,
                                 &schema::decoded_parameter::is_recipient);
  return it == std::end(parameters) ? nullptr : &*it;
}

// First non-null candidate.
const schema::decoded_parameter* pick(
    std::initializer_list<const schema::decoded_parameter*> candidates) {
  for (const auto* candidate : candidates) {
    if (candidate != nullptr) {
      return candidate;
    }
  }
  return nullptr;
}

std::string_view strip_underscores(std::string_view name) {
  while (name.starts_with('_')) {
    name.remove_prefix(1);
  }
  return name;
}

std::string generic(const schema::decoded_action& action) {
  return fmt::format("Call {}() on {}", action.function_name,
                     action.contract_name);
}

}  // namespace

std::string_view short_amount(const std::string_view display) {
  auto open = display.find(" (");
  if (open == std::string_view::npos || !display.ends_with(')')) {
    return display;
  }
  return display.substr(open + 2, display.size() - open - 3);
}

std::string describe_action(const schema::decoded_action& action) {
  const auto& contract = action.contract_name;
  const auto& parameters = action.parameters;

  if (action.function_name.empty()) {
    if (classify::is_bare_eth_transfer(action)) {
      return fmt::format("Transfer {} to {}", action.value_formatted, contract);
    }
    return fmt::format("Empty call to {}", contract);
  }

  auto function = strip_underscores(action.function_name);

  if (function == "sendOrRegisterDebt") {
    const auto* account = pick({named(parameters, "account"),
                                first_recipient(parameters),
                                at(parameters, 0)});
    const auto* amount =
        pick({named(parameters, "amount"), at(parameters, 1)});
    if (account == nullptr || amount == nullptr) {
      return generic(action);
    }
    const auto* raw = std::get_if<schema::big_int_t>(&amount->raw_value.value);
    auto dollars = raw != nullptr ? format::format_usd(*raw, 6)
                                  : amount->display_value;
    return fmt::format("Send payment of {} USDC to {} via {}", dollars,
                       account->display_value, contract);
  }

  if (function == "transfer") {
    const auto* recipient =
        pick({first_recipient(parameters), at(parameters, 0)});
    const auto* amount =
        pick({named(parameters, "amount"), at(parameters, 1)});
    if (recipient == nullptr || amount == nullptr) {
      return generic(action);
    }
    return fmt::format("Transfer {} to {}",
                       short_amount(amount->display_value),
                       recipient->display_value);
  }

  if (function == "transferFrom" || function == "safeTransferFrom") {
    const auto* to = pick({named(parameters, "to"), at(parameters, 1)});
    if (to == nullptr) {
      return generic(action);
    }
    if (const auto* token = named(parameters, "tokenId")) {
      auto noun = contract == "Nouns Token" ? "Noun" : "token";
      return fmt::format("Transfer {} {} to {}", noun, token->display_value,
                         to->display_value);
    }
    if (const auto* amount = named(parameters, "amount")) {
      return fmt::format("Transfer {} from {} to {}",
                         short_amount(amount->display_value), contract,
                         to->display_value);
    }
    return fmt::format("Transfer from {} to {}", contract, to->display_value);
  }

  if (function == "approve") {
    const auto* spender =
        pick({first_recipient(parameters), at(parameters, 0)});
    const auto* amount =
        pick({named(parameters, "amount"), at(parameters, 1)});
    if (spender == nullptr || amount == nullptr) {
      return generic(action);
    }
    return fmt::format("Approve {} to spend {}", spender->display_value,
                       short_amount(amount->display_value));
  }

  if (function == "delegate") {
    const auto* delegatee =
        pick({named(parameters, "delegatee"), at(parameters, 0)});
    if (delegatee == nullptr) {
      return generic(action);
    }
    return fmt::format("Delegate voting power to {}",
                       delegatee->display_value);
  }

  if (function.starts_with("set") && !parameters.empty()) {
    return fmt::format("Set {} to {} in {}", parameters.front().name,
                       parameters.front().display_value, contract);
  }

  auto lower = schema::to_lower(function);
  if (lower.find("mint") != std::string::npos) {
    return fmt::format("Mint via {}", contract);
  }
  if (lower.find("withdraw") != std::string::npos) {
    return fmt::format("Withdraw from {}", contract);
  }
  if (lower.find("deposit") != std::string::npos) {
    return fmt::format("Deposit to {}", contract);
  }
  return generic(action);
}

}  // namespace docket::decoder
