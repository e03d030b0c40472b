#include <gtest/gtest.h>
#include <docket/abi/type_parser.hpp>
#include <docket/decoder/manual_decoder.hpp>
#include <docket/testing/common.hpp>

namespace {

class manual_decoder_test : public ::testing::Test {
 protected:
  std::vector<docket::schema::decoded_parameter> decode(
      std::string signature,
      std::string calldata) const {
    auto descriptor = docket::schema::call_descriptor{
        .target = std::string{docket::testing::kUnknownContract},
        .value = "0",
        .signature = std::move(signature),
        .calldata = std::move(calldata),
    };
    return decoder.decode(descriptor,
                          docket::abi::function_name_of(descriptor.signature));
  }

  docket::registry::schema_registry registry;
  docket::format::decimals_strategy decimals =
      docket::format::decimals_strategy::defaults();
  docket::decoder::manual_decoder decoder{registry, decimals};
};

}  // namespace

TEST_F(manual_decoder_test, transfer_uses_conventional_names) {
  auto parameters = decode(
      "transfer(address,uint256)",
      docket::testing::calldata(
          "a9059cbb",
          {docket::testing::address_word(docket::testing::kBob),
           docket::testing::word(docket::schema::big_int_t{
               2'500'000'000'000'000'000})}));
  ASSERT_EQ(parameters.size(), 2u);
  EXPECT_EQ(parameters[0].name, "recipient");
  EXPECT_TRUE(parameters[0].is_recipient);
  EXPECT_EQ(parameters[0].display_value, docket::testing::kBob);
  EXPECT_EQ(parameters[1].name, "amount");
  EXPECT_EQ(parameters[1].display_value,
            "2,500,000,000,000,000,000 (2.5000 tokens)");
}

TEST_F(manual_decoder_test, parameter_only_calldata_decodes_the_same) {
  auto words = {docket::testing::address_word(docket::testing::kBob),
                docket::testing::word(42)};
  auto prefixed =
      decode("transfer(address,uint256)",
             docket::testing::calldata("a9059cbb", words));
  auto bare = decode("transfer(address,uint256)",
                     docket::testing::parameters_only(words));
  EXPECT_EQ(prefixed, bare);
}

TEST_F(manual_decoder_test, transfer_from_flags_only_the_destination) {
  auto parameters = decode(
      "transferFrom(address,address,uint256)",
      docket::testing::calldata(
          "23b872dd", {docket::testing::address_word(docket::testing::kAlice),
                       docket::testing::address_word(docket::testing::kBob),
                       docket::testing::word(7)}));
  ASSERT_EQ(parameters.size(), 3u);
  EXPECT_FALSE(parameters[0].is_recipient);
  EXPECT_TRUE(parameters[1].is_recipient);
  EXPECT_FALSE(parameters[2].is_recipient);
  EXPECT_EQ(parameters[2].name, "tokenId");
}

TEST_F(manual_decoder_test, approve_marks_the_spender) {
  auto parameters = decode(
      "approve(address,uint256)",
      docket::testing::calldata(
          "095ea7b3", {docket::testing::address_word(docket::testing::kBob),
                       docket::testing::word(1)}));
  ASSERT_EQ(parameters.size(), 2u);
  EXPECT_TRUE(parameters[0].is_recipient);
  EXPECT_EQ(parameters[0].recipient_role,
            std::optional<std::string>{"Approved Spender"});
}

TEST_F(manual_decoder_test, short_payload_yields_opaque_words) {
  auto parameters =
      decode("transfer(address,uint256)",
             docket::testing::parameters_only(
                 {docket::testing::address_word(docket::testing::kBob)}) +
                 "0102");
  ASSERT_EQ(parameters.size(), 2u);
  EXPECT_TRUE(parameters[0].is_recipient);
  EXPECT_EQ(parameters[1].display_value, "0102");
  EXPECT_EQ(std::get<std::string>(parameters[1].raw_value.value), "0102");
}

TEST_F(manual_decoder_test, dynamic_types_stay_opaque) {
  auto parameters = decode(
      "execute(bytes)",
      docket::testing::parameters_only({docket::testing::word(32)}));
  ASSERT_EQ(parameters.size(), 1u);
  EXPECT_EQ(parameters[0].name, "param0");
  EXPECT_EQ(parameters[0].display_value, docket::testing::word(32));
}

TEST_F(manual_decoder_test, scalar_kinds_are_interpreted) {
  auto parameters = decode(
      "configure(bool,int256,bytes4)",
      docket::testing::parameters_only(
          {docket::testing::word(1), std::string(64, 'f'),
           "cafebabe" + std::string(56, '0')}));
  ASSERT_EQ(parameters.size(), 3u);
  EXPECT_EQ(parameters[0].display_value, "true");
  EXPECT_EQ(parameters[1].display_value, "-1");
  EXPECT_EQ(parameters[2].display_value, "0xcafebabe");
}

TEST_F(manual_decoder_test, unusable_input_yields_no_parameters) {
  EXPECT_TRUE(decode("pause", "0x" + docket::testing::word(1)).empty());
  EXPECT_TRUE(decode("pause()", "0x" + docket::testing::word(1)).empty());
  EXPECT_TRUE(decode("transfer(address,uint256)", "0x").empty());
  EXPECT_TRUE(decode("transfer(address,uint256)", "0xzz").empty());
}

TEST(manual_decoder, fallback_names) {
  EXPECT_EQ(docket::decoder::fallback_parameter_name("delegate", 0),
            "delegatee");
  EXPECT_EQ(docket::decoder::fallback_parameter_name("delegate", 1),
            "param1");
  EXPECT_EQ(docket::decoder::fallback_parameter_name("poke", 0), "param0");
}
