#include <gtest/gtest.h>
#include <docket/decoder/action_decoder.hpp>
#include <docket/registry/builtin_contracts.hpp>
#include <docket/testing/common.hpp>

namespace {

class action_decoder_test : public ::testing::Test {
 protected:
  docket::registry::schema_registry registry;
  docket::decoder::action_decoder decoder{registry};
};

docket::schema::call_descriptor payer_debt() {
  return docket::schema::call_descriptor{
      .target = std::string{docket::registry::kPayerAddress},
      .value = "0",
      .signature = "sendOrRegisterDebt(address,uint256)",
      .calldata = docket::testing::calldata(
          "4223a5bb", {docket::testing::address_word(docket::testing::kAlice),
                       docket::testing::word(9'000'000'000)}),
  };
}

docket::schema::call_descriptor usdc_transfer(
    const std::string_view to,
    const uint64_t amount,
    std::string signature = "transfer(address,uint256)") {
  return docket::schema::call_descriptor{
      .target = std::string{docket::registry::kUsdcAddress},
      .value = "0",
      .signature = std::move(signature),
      .calldata = docket::testing::calldata(
          "a9059cbb",
          {docket::testing::address_word(to), docket::testing::word(amount)}),
  };
}

}  // namespace

TEST_F(action_decoder_test, payer_debt_registration) {
  auto action = decoder.decode(payer_debt());
  EXPECT_EQ(action.contract_name, "Payer");
  EXPECT_TRUE(action.is_known_contract);
  EXPECT_EQ(action.function_name, "sendOrRegisterDebt");
  EXPECT_EQ(action.value_formatted, "0 ETH");
  EXPECT_EQ(action.category, docket::schema::action_category::payment);
  EXPECT_EQ(action.severity, docket::schema::action_severity::normal);
  ASSERT_EQ(action.parameters.size(), 2u);
  EXPECT_EQ(action.parameters[1].display_value, "9,000,000,000 ($9,000.00)");
  EXPECT_EQ(action.summary,
            "Send payment of $9,000.00 USDC to "
            "0x1111111111111111111111111111111111111111 via Payer");
  EXPECT_EQ(action.addresses_to_resolve,
            std::vector<std::string>{std::string{docket::testing::kAlice}});
}

TEST_F(action_decoder_test, unknown_contract_falls_back_to_manual_decode) {
  auto action = decoder.decode(docket::schema::call_descriptor{
      .target = std::string{docket::testing::kUnknownContract},
      .value = "0",
      .signature = "transfer(address,uint256)",
      .calldata = docket::testing::calldata(
          "a9059cbb",
          {docket::testing::address_word(docket::testing::kBob),
           docket::testing::word(docket::schema::big_int_t{
               2'500'000'000'000'000'000})}),
  });
  EXPECT_FALSE(action.is_known_contract);
  EXPECT_EQ(action.contract_name, "0x3333...3333");
  EXPECT_EQ(action.contract_description, "Unknown contract");
  EXPECT_EQ(action.function_description, "Call transfer on 0x3333...3333");
  EXPECT_EQ(action.summary,
            "Transfer 2.5000 tokens to "
            "0x2222222222222222222222222222222222222222");
  EXPECT_EQ(action.category, docket::schema::action_category::payment);
}

TEST_F(action_decoder_test, approve_flags_the_spender) {
  auto action = decoder.decode(docket::schema::call_descriptor{
      .target = std::string{docket::registry::kUsdcAddress},
      .value = "0",
      .signature = "approve(address,uint256)",
      .calldata = docket::testing::calldata(
          "095ea7b3", {docket::testing::address_word(docket::testing::kBob),
                       docket::testing::word(1'000'000)}),
  });
  ASSERT_EQ(action.parameters.size(), 2u);
  EXPECT_TRUE(action.parameters[0].is_recipient);
  EXPECT_EQ(action.parameters[0].recipient_role,
            std::optional<std::string>{"Approved Spender"});
  EXPECT_EQ(action.category, docket::schema::action_category::approval);
  EXPECT_EQ(action.summary,
            "Approve 0x2222222222222222222222222222222222222222 to spend "
            "$1.00");
}

TEST_F(action_decoder_test, noun_transfer_flags_only_destination) {
  auto action = decoder.decode(docket::schema::call_descriptor{
      .target = "0x9c8ff314c9bc7f6e59a9d9225fb22946427edc03",
      .value = "0",
      .signature = "transferFrom(address,address,uint256)",
      .calldata = docket::testing::calldata(
          "23b872dd", {docket::testing::address_word(docket::testing::kAlice),
                       docket::testing::address_word(docket::testing::kBob),
                       docket::testing::word(42)}),
  });
  ASSERT_EQ(action.parameters.size(), 3u);
  EXPECT_FALSE(action.parameters[0].is_recipient);
  EXPECT_TRUE(action.parameters[1].is_recipient);
  EXPECT_FALSE(action.parameters[2].is_recipient);
  EXPECT_EQ(action.category, docket::schema::action_category::token);
  EXPECT_EQ(action.summary,
            "Transfer Noun 42 to 0x2222222222222222222222222222222222222222");
}

TEST_F(action_decoder_test, selector_and_parameter_only_calldata_agree) {
  auto prefixed = usdc_transfer(docket::testing::kBob, 5'000'000);
  auto bare = prefixed;
  bare.calldata = "0x" + prefixed.calldata.substr(10);

  auto a = decoder.decode(prefixed);
  auto b = decoder.decode(bare);
  EXPECT_EQ(a.parameters, b.parameters);
  EXPECT_EQ(a.summary, b.summary);
  EXPECT_EQ(a.category, b.category);
  EXPECT_EQ(a.summary,
            "Transfer $5.00 to 0x2222222222222222222222222222222222222222");
}

TEST_F(action_decoder_test, empty_signature_resolves_same_function) {
  auto signed_call = decoder.decode(usdc_transfer(docket::testing::kBob, 1));
  auto unsigned_call =
      decoder.decode(usdc_transfer(docket::testing::kBob, 1, ""));
  EXPECT_EQ(unsigned_call.function_name, signed_call.function_name);
  EXPECT_EQ(unsigned_call.signature, "transfer(address,uint256)");
  EXPECT_EQ(unsigned_call.parameters, signed_call.parameters);
}

TEST_F(action_decoder_test, decoding_is_idempotent) {
  auto descriptor = payer_debt();
  EXPECT_EQ(decoder.decode(descriptor), decoder.decode(descriptor));
}

TEST_F(action_decoder_test, bare_eth_transfer) {
  auto action = decoder.decode(docket::schema::call_descriptor{
      .target = std::string{docket::testing::kAlice},
      .value = "1500000000000000000",
      .signature = "",
      .calldata = "0x",
  });
  EXPECT_TRUE(action.function_name.empty());
  EXPECT_EQ(action.value_formatted, "1.5 ETH");
  EXPECT_EQ(action.function_description, "Transfer ETH");
  EXPECT_EQ(action.summary, "Transfer 1.5 ETH to 0x1111...1111");
  EXPECT_EQ(action.category, docket::schema::action_category::payment);
  EXPECT_EQ(action.addresses_to_resolve,
            std::vector<std::string>{std::string{docket::testing::kAlice}});
}

TEST_F(action_decoder_test, empty_call) {
  auto action = decoder.decode(docket::schema::call_descriptor{
      .target = std::string{docket::registry::kTreasuryAddress},
      .value = "0",
      .calldata = "0x",
  });
  EXPECT_EQ(action.function_description, "No function call");
  EXPECT_EQ(action.summary, "Empty call to Nouns Treasury");
  EXPECT_EQ(action.category, docket::schema::action_category::unknown);
  EXPECT_TRUE(action.addresses_to_resolve.empty());
}

TEST_F(action_decoder_test, schema_description_is_used) {
  auto action = decoder.decode(usdc_transfer(docket::testing::kBob, 1));
  EXPECT_EQ(action.function_description, "Transfer tokens");
}

TEST_F(action_decoder_test, runtime_registration_takes_effect) {
  auto descriptor = docket::schema::call_descriptor{
      .target = std::string{docket::testing::kUnknownContract},
      .value = "0",
      .signature = "payGrant(address,uint256)",
      .calldata = docket::testing::parameters_only(
          {docket::testing::address_word(docket::testing::kAlice),
           docket::testing::word(3)}),
  };
  auto before = decoder.decode(descriptor);
  EXPECT_EQ(before.parameters[0].name, "param0");

  ASSERT_TRUE(registry.register_schema(
      docket::testing::kUnknownContract, "Grants", "Grant payouts",
      "function payGrant(address recipient, uint256 amount)"));
  auto after = decoder.decode(descriptor);
  EXPECT_EQ(after.contract_name, "Grants");
  EXPECT_EQ(after.parameters[0].name, "recipient");
  EXPECT_TRUE(after.parameters[0].is_recipient);
}

TEST_F(action_decoder_test, malformed_input_never_throws) {
  auto inputs = std::vector<docket::schema::call_descriptor>{
      {},
      {.target = "garbage", .value = "-5", .signature = "((((",
       .calldata = "0xzz"},
      {.target = std::string{docket::registry::kUsdcAddress},
       .value = "not a number",
       .signature = "transfer(address,uint256)",
       .calldata = "0x123"},
      {.target = std::string{docket::registry::kUsdcAddress},
       .signature = "transfer(address,uint256)",
       .calldata = "0xa9059cbb" + std::string(62, 'f')},
      {.target = std::string{docket::testing::kUnknownContract},
       .signature = "f(uint256[],string,(bool,bytes))",
       .calldata = "0x" + std::string(6000, 'f')},
  };
  for (const auto& input : inputs) {
    EXPECT_NO_THROW({
      auto action = decoder.decode(input);
      EXPECT_EQ(action.target, input.target);
      EXPECT_FALSE(action.summary.empty());
    });
  }
}
