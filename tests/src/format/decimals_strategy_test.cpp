#include <gtest/gtest.h>
#include <docket/format/decimals_strategy.hpp>
#include <docket/registry/builtin_contracts.hpp>
#include <docket/testing/common.hpp>

namespace {

docket::schema::decoded_parameter uint_parameter(std::string name,
                                                 const uint64_t value) {
  return docket::schema::decoded_parameter{
      .name = std::move(name),
      .declared_type = "uint256",
      .base_type = "uint256",
      .raw_value =
          docket::schema::decoded_value{docket::schema::big_int_t{value}},
  };
}

docket::schema::decoded_parameter address_parameter(
    std::string name,
    const std::string_view address) {
  return docket::schema::decoded_parameter{
      .name = std::move(name),
      .declared_type = "address",
      .base_type = "address",
      .raw_value = docket::schema::decoded_value{
          docket::schema::try_make_address(address).value()},
  };
}

}  // namespace

TEST(decimals_strategy, explicit_parameter_convention_wins) {
  auto strategy = docket::format::decimals_strategy::defaults();
  auto convention = strategy.resolve(docket::registry::kPayerAddress,
                                     "sendOrRegisterDebt", "amount", {});
  ASSERT_TRUE(convention.has_value());
  EXPECT_EQ(convention->decimals, 6);
  EXPECT_TRUE(convention->usd);
}

TEST(decimals_strategy, token_contract_scales_erc20_amounts) {
  auto strategy = docket::format::decimals_strategy::defaults();
  auto parameters = std::vector{uint_parameter("amount", 1)};
  auto weth = strategy.resolve(docket::registry::kWethAddress, "transfer",
                               "amount", parameters);
  ASSERT_TRUE(weth.has_value());
  EXPECT_EQ(weth->symbol, "WETH");
  EXPECT_FALSE(strategy
                   .resolve(docket::testing::kUnknownContract, "transfer",
                            "amount", parameters)
                   .has_value());
  EXPECT_FALSE(strategy
                   .resolve(docket::registry::kWethAddress, "setFee",
                            "amount", parameters)
                   .has_value());
}

TEST(decimals_strategy, token_parameter_names_the_token) {
  auto strategy = docket::format::decimals_strategy::defaults();
  auto parameters = std::vector{
      address_parameter("tokenAddress", docket::registry::kWethAddress),
      uint_parameter("tokenAmount", 1)};
  auto convention = strategy.resolve(docket::registry::kStreamFactoryAddress,
                                     "createStream", "tokenAmount", parameters);
  ASSERT_TRUE(convention.has_value());
  EXPECT_EQ(convention->symbol, "WETH");
}

TEST(decimals_strategy, format_amount_keeps_raw_value) {
  EXPECT_EQ(docket::format::format_amount(
                docket::schema::big_int_t{9'000'000'000},
                docket::format::token_convention{
                    .decimals = 6, .symbol = "USDC", .usd = true}),
            "9,000,000,000 ($9,000.00)");
  EXPECT_EQ(docket::format::format_amount(
                docket::schema::big_int_t{1'500'000'000'000'000'000},
                docket::format::token_convention{.decimals = 18,
                                                 .symbol = "WETH"}),
            "1,500,000,000,000,000,000 (1.5 WETH)");
}

TEST(decimals_strategy, generic_heuristic_applies_above_threshold) {
  auto strategy = docket::format::decimals_strategy::defaults();
  EXPECT_FALSE(strategy
                   .apply_generic_heuristic(
                       docket::schema::big_int_t{1'000'000'000'000'000})
                   .has_value());
  EXPECT_EQ(strategy.apply_generic_heuristic(
                docket::schema::big_int_t{2'500'000'000'000'000'000}),
            std::optional<std::string>{
                "2,500,000,000,000,000,000 (2.5000 tokens)"});

  strategy.set_generic_heuristic(false, 0, 18);
  EXPECT_FALSE(strategy
                   .apply_generic_heuristic(
                       docket::schema::big_int_t{2'500'000'000'000'000'000})
                   .has_value());
}

TEST(decimals_strategy, configured_conventions_extend_defaults) {
  auto config = docket::config::decoder_config{};
  config.extra_conventions.push_back(docket::config::decimals_convention{
      .function = "claim", .parameter = "amount", .decimals = 6,
      .symbol = "USD"});
  auto strategy = docket::format::decimals_strategy::from_config(config);
  auto convention = strategy.resolve(docket::testing::kUnknownContract, "claim",
                                     "amount", {});
  ASSERT_TRUE(convention.has_value());
  EXPECT_TRUE(convention->usd);
  EXPECT_TRUE(strategy
                  .resolve(docket::registry::kPayerAddress,
                           "sendOrRegisterDebt", "amount", {})
                  .has_value());
}

TEST(decimals_strategy, apply_amount_conventions_rewrites_displays) {
  auto strategy = docket::format::decimals_strategy::defaults();
  auto parameters =
      std::vector{address_parameter("to", docket::testing::kAlice),
                  uint_parameter("amount", 9'000'000'000)};
  parameters[0].display_value = std::string{docket::testing::kAlice};
  parameters[1].display_value = "9,000,000,000";
  docket::format::apply_amount_conventions(
      strategy, docket::registry::kUsdcAddress, "transfer", parameters, true);
  EXPECT_EQ(parameters[0].display_value, docket::testing::kAlice);
  EXPECT_EQ(parameters[1].display_value, "9,000,000,000 ($9,000.00)");
}

TEST(decimals_strategy, generic_heuristic_needs_permission) {
  auto strategy = docket::format::decimals_strategy::defaults();
  auto parameters =
      std::vector{uint_parameter("amount", 2'500'000'000'000'000'000)};
  parameters[0].display_value = "raw";
  docket::format::apply_amount_conventions(
      strategy, docket::testing::kUnknownContract, "payout", parameters,
      false);
  EXPECT_EQ(parameters[0].display_value, "raw");
  docket::format::apply_amount_conventions(
      strategy, docket::testing::kUnknownContract, "payout", parameters, true);
  EXPECT_EQ(parameters[0].display_value,
            "2,500,000,000,000,000,000 (2.5000 tokens)");
}
