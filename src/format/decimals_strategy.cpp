#include <docket/format/decimals_strategy.hpp>
#include <docket/format/number.hpp>
#include <docket/registry/builtin_contracts.hpp>

#include <algorithm>
#include <array>

namespace docket::format {

namespace {

// Functions whose integer parameters are amounts of the called token.
constexpr auto kTokenAmountFunctions = std::array<std::string_view, 9>{
    "transfer", "transferFrom",      "approve",
    "withdraw", "increaseAllowance", "decreaseAllowance",
    "mint",     "burn",              "deposit"};

const auto kUsdc =
    token_convention{.decimals = 6, .symbol = "USDC", .usd = true};
const auto kWeth = token_convention{.decimals = 18, .symbol = "WETH"};

bool is_integer(const std::string_view base_type) {
  return base_type.starts_with("uint") || base_type.starts_with("int");
}

}  // namespace

decimals_strategy decimals_strategy::defaults() {
  auto strategy = decimals_strategy{};
  strategy.add_parameter_convention("sendOrRegisterDebt", "amount", kUsdc);
  strategy.add_parameter_convention("payBackDebt", "amount", kUsdc);
  strategy.add_parameter_convention("buyETH", "tokenAmount", kUsdc);
  strategy.add_token_convention(registry::kUsdcAddress, kUsdc);
  strategy.add_token_convention(registry::kWethAddress, kWeth);
  strategy.add_token_parameter("createStream", "tokenAmount", "tokenAddress");
  strategy.add_token_parameter("createAndFundStream", "tokenAmount",
                               "tokenAddress");
  strategy.add_token_parameter("sendERC20", "tokensToSend", "erc20Token");
  return strategy;
}

decimals_strategy decimals_strategy::from_config(
    const config::decoder_config& config) {
  auto strategy = defaults();
  for (const auto& extra : config.extra_conventions) {
    auto usd = extra.symbol == "USD" || extra.symbol == "USDC";
    strategy.add_parameter_convention(
        extra.function, extra.parameter,
        token_convention{
            .decimals = extra.decimals, .symbol = extra.symbol, .usd = usd});
  }
  strategy.set_generic_heuristic(config.generic_token_heuristic,
                                 config.generic_token_threshold,
                                 config.generic_token_decimals);
  return strategy;
}

void decimals_strategy::add_parameter_convention(std::string function,
                                                 std::string parameter,
                                                 token_convention convention) {
  parameters_.insert_or_assign(
      key_t{std::move(function), std::move(parameter)}, std::move(convention));
}

void decimals_strategy::add_token_convention(const std::string_view address,
                                             token_convention convention) {
  tokens_.insert_or_assign(schema::normalize_address(address),
                           std::move(convention));
}

void decimals_strategy::add_token_parameter(std::string function,
                                            std::string amount_parameter,
                                            std::string token_parameter) {
  token_parameters_.insert_or_assign(
      key_t{std::move(function), std::move(amount_parameter)},
      std::move(token_parameter));
}

std::optional<token_convention> decimals_strategy::for_token(
    const std::string_view address) const {
  auto it = tokens_.find(schema::normalize_address(address));
  if (it == std::end(tokens_)) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<token_convention> decimals_strategy::resolve(
    const std::string_view target,
    const std::string_view function,
    const std::string_view parameter,
    const std::vector<schema::decoded_parameter>& parameters) const {
  auto key = key_t{std::string{function}, std::string{parameter}};
  if (auto it = parameters_.find(key); it != std::end(parameters_)) {
    return it->second;
  }

  auto target_parameter = std::ranges::find(parameters, parameter,
                                            &schema::decoded_parameter::name);
  auto is_amount = target_parameter != std::end(parameters) &&
                   is_integer(target_parameter->base_type);
  if (is_amount && std::ranges::find(kTokenAmountFunctions, function) !=
                       std::end(kTokenAmountFunctions)) {
    if (auto token = for_token(target); token) {
      return token;
    }
  }

  if (auto it = token_parameters_.find(key);
      it != std::end(token_parameters_)) {
    auto token = std::ranges::find(parameters, it->second,
                                   &schema::decoded_parameter::name);
    if (token != std::end(parameters)) {
      if (const auto* address =
              std::get_if<schema::address_t>(&token->raw_value.value)) {
        return for_token(schema::to_string(*address));
      }
    }
  }
  return std::nullopt;
}

void decimals_strategy::set_generic_heuristic(const bool enabled,
                                              schema::big_int_t threshold,
                                              const uint8_t decimals) {
  generic_enabled_ = enabled;
  generic_threshold_ = std::move(threshold);
  generic_decimals_ = decimals;
}

std::optional<std::string> decimals_strategy::apply_generic_heuristic(
    const schema::big_int_t& value) const {
  if (!generic_enabled_ || value <= generic_threshold_) {
    return std::nullopt;
  }
  return group_digits(value) + " (" +
         format_scaled(value, generic_decimals_, 4, false, false) + " tokens)";
}

std::string format_token_amount(const schema::big_int_t& value,
                                const token_convention& convention) {
  if (convention.usd) {
    return format_usd(value, convention.decimals);
  }
  return format_scaled(value, convention.decimals, 4, true, true) + " " +
         convention.symbol;
}

std::string format_amount(const schema::big_int_t& value,
                          const token_convention& convention) {
  return group_digits(value) + " (" + format_token_amount(value, convention) +
         ")";
}

void apply_amount_conventions(
    const decimals_strategy& strategy,
    const std::string_view target,
    const std::string_view function,
    std::vector<schema::decoded_parameter>& parameters,
    const bool allow_generic) {
  for (auto& parameter : parameters) {
    const auto* value =
        std::get_if<schema::big_int_t>(&parameter.raw_value.value);
    if (value == nullptr) {
      continue;
    }
    if (auto convention =
            strategy.resolve(target, function, parameter.name, parameters);
        convention) {
      parameter.display_value = format_amount(*value, *convention);
      continue;
    }
    if (!allow_generic) {
      continue;
    }
    if (auto generic = strategy.apply_generic_heuristic(*value); generic) {
      parameter.display_value = std::move(*generic);
    }
  }
}

}  // namespace docket::format
