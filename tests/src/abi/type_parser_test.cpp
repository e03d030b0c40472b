#include <gtest/gtest.h>
#include <docket/abi/type_parser.hpp>

TEST(type_parser, bare_uint_defaults_to_256_bits) {
  auto type = docket::abi::parse_type("uint");
  ASSERT_TRUE(type.has_value());
  EXPECT_EQ(type->kind, docket::schema::abi_kind::unsigned_integer);
  EXPECT_EQ(type->width, 256);
  EXPECT_EQ(docket::schema::canonical_type(*type), "uint256");
}

TEST(type_parser, rejects_invalid_widths) {
  EXPECT_FALSE(docket::abi::parse_type("uint7").has_value());
  EXPECT_FALSE(docket::abi::parse_type("int264").has_value());
  EXPECT_FALSE(docket::abi::parse_type("bytes33").has_value());
  EXPECT_FALSE(docket::abi::parse_type("bytes0").has_value());
  EXPECT_FALSE(docket::abi::parse_type("addresss").has_value());
}

TEST(type_parser, arrays_nest_through_components) {
  auto type = docket::abi::parse_type("address[2][]");
  ASSERT_TRUE(type.has_value());
  EXPECT_EQ(type->kind, docket::schema::abi_kind::array);
  EXPECT_FALSE(type->length.has_value());
  ASSERT_EQ(type->components.size(), 1u);
  EXPECT_EQ(type->components.front().length, std::optional<std::size_t>{2});
  EXPECT_EQ(docket::schema::canonical_type(*type), "address[2][]");
  EXPECT_EQ(docket::schema::base_type(*type), "address");
  EXPECT_TRUE(docket::schema::is_dynamic(*type));
}

TEST(type_parser, tuples_keep_field_names) {
  auto type = docket::abi::parse_type("tuple(address to, uint256 amount)[2]");
  ASSERT_TRUE(type.has_value());
  EXPECT_EQ(docket::schema::canonical_type(*type), "(address,uint256)[2]");
  EXPECT_EQ(docket::schema::base_type(*type), "tuple");
  EXPECT_FALSE(docket::schema::is_dynamic(*type));
  EXPECT_EQ(docket::schema::head_words(*type), 4u);
  const auto& tuple = type->components.front();
  EXPECT_EQ(tuple.component_names,
            (std::vector<std::string>{"to", "amount"}));
}

TEST(type_parser, function_fragment_yields_canonical_signature) {
  auto function = docket::abi::parse_function(
      "function transfer(address to, uint amount) external returns (bool)");
  ASSERT_TRUE(function.has_value());
  EXPECT_EQ(function->name, "transfer");
  EXPECT_EQ(function->signature, "transfer(address,uint256)");
  ASSERT_EQ(function->parameters.size(), 2u);
  EXPECT_EQ(function->parameters[0].name, "to");
  EXPECT_EQ(function->parameters[1].declared_type, "uint256");
  EXPECT_FALSE(function->selector.has_value());
}

TEST(type_parser, function_keyword_is_optional) {
  auto function = docket::abi::parse_function("withdraw(uint256 wad)");
  ASSERT_TRUE(function.has_value());
  EXPECT_EQ(function->signature, "withdraw(uint256)");
}

TEST(type_parser, storage_modifiers_are_ignored) {
  auto function = docket::abi::parse_function(
      "function execute(bytes calldata data, string memory note)");
  ASSERT_TRUE(function.has_value());
  EXPECT_EQ(function->signature, "execute(bytes,string)");
  EXPECT_EQ(function->parameters[0].name, "data");
  EXPECT_EQ(function->parameters[1].name, "note");
}

TEST(type_parser, malformed_fragments_are_rejected) {
  EXPECT_FALSE(docket::abi::parse_function("transfer address").has_value());
  EXPECT_FALSE(docket::abi::parse_function("transfer(address").has_value());
  EXPECT_FALSE(
      docket::abi::parse_function("transfer(address to, )").has_value());
  EXPECT_FALSE(docket::abi::parse_function("1transfer()").has_value());
  EXPECT_FALSE(
      docket::abi::parse_function("transfer(address to from)").has_value());
}

TEST(type_parser, function_name_of_trims_and_stops_at_parenthesis) {
  EXPECT_EQ(docket::abi::function_name_of("  transfer (address)"), "transfer");
  EXPECT_EQ(docket::abi::function_name_of("pause"), "pause");
  EXPECT_EQ(docket::abi::function_name_of(""), "");
}

TEST(type_parser, split_signature_types_is_a_flat_comma_split) {
  auto types = docket::abi::split_signature_types("f(address, uint256)");
  ASSERT_TRUE(types.has_value());
  EXPECT_EQ(*types, (std::vector<std::string>{"address", "uint256"}));

  auto empty = docket::abi::split_signature_types("pause()");
  ASSERT_TRUE(empty.has_value());
  EXPECT_TRUE(empty->empty());

  EXPECT_FALSE(docket::abi::split_signature_types("pause").has_value());
}

TEST(type_parser, split_signature_types_stops_at_first_close) {
  auto types =
      docket::abi::split_signature_types("f(address) returns (bool)");
  ASSERT_TRUE(types.has_value());
  EXPECT_EQ(*types, (std::vector<std::string>{"address"}));
}
