#include <gtest/gtest.h>
#include <docket/format/number.hpp>

TEST(number, group_digits_inserts_thousands_separators) {
  EXPECT_EQ(docket::format::group_digits(docket::schema::big_int_t{0}), "0");
  EXPECT_EQ(docket::format::group_digits(docket::schema::big_int_t{999}),
            "999");
  EXPECT_EQ(
      docket::format::group_digits(docket::schema::big_int_t{9'000'000'000}),
      "9,000,000,000");
  EXPECT_EQ(docket::format::group_digits(docket::schema::big_int_t{-1234}),
            "-1,234");
}

TEST(number, format_scaled_rounds_half_up) {
  EXPECT_EQ(docket::format::format_scaled(
                docket::schema::big_int_t{1'234'567}, 6, 2, true, false),
            "1.23");
  EXPECT_EQ(docket::format::format_scaled(
                docket::schema::big_int_t{1'235'000}, 6, 2, true, false),
            "1.24");
  EXPECT_EQ(docket::format::format_scaled(
                docket::schema::big_int_t{5}, 0, 2, true, false),
            "5.00");
}

TEST(number, format_scaled_trims_trailing_zeros) {
  auto value = docket::schema::big_int_t{1'500'000'000'000'000'000};
  EXPECT_EQ(docket::format::format_scaled(value, 18, 4, true, true), "1.5");
  EXPECT_EQ(docket::format::format_scaled(value, 18, 4, true, false),
            "1.5000");
  EXPECT_EQ(docket::format::format_scaled(
                docket::schema::big_int_t{9'000'000'000}, 6, 4, true, true),
            "9,000");
}

TEST(number, format_usd_uses_two_decimals) {
  EXPECT_EQ(docket::format::format_usd(docket::schema::big_int_t{9'000'000'000},
                                       6),
            "$9,000.00");
  EXPECT_EQ(docket::format::format_usd(docket::schema::big_int_t{1}, 6),
            "$0.00");
  EXPECT_EQ(docket::format::format_usd(docket::schema::big_int_t{-2'500'000},
                                       6),
            "-$2.50");
}

TEST(number, try_parse_uint_accepts_decimal_and_hex) {
  EXPECT_EQ(docket::format::try_parse_uint("007"),
            std::optional{docket::schema::big_int_t{7}});
  EXPECT_EQ(docket::format::try_parse_uint("0x0de0b6b3a7640000"),
            std::optional{docket::schema::big_int_t{1'000'000'000'000'000'000}});
  EXPECT_FALSE(docket::format::try_parse_uint("").has_value());
  EXPECT_FALSE(docket::format::try_parse_uint("-1").has_value());
  EXPECT_FALSE(docket::format::try_parse_uint("1.5").has_value());
  EXPECT_FALSE(docket::format::try_parse_uint("0x").has_value());
}

TEST(number, format_eth_value_thresholds) {
  EXPECT_EQ(docket::format::format_eth_value(""), "0 ETH");
  EXPECT_EQ(docket::format::format_eth_value("0"), "0 ETH");
  EXPECT_EQ(docket::format::format_eth_value("000"), "0 ETH");
  EXPECT_EQ(docket::format::format_eth_value("99999999999999"),
            "99999999999999 wei");
  EXPECT_EQ(docket::format::format_eth_value("100000000000000"), "0.0001 ETH");
  EXPECT_EQ(docket::format::format_eth_value("1000000000000000000"), "1 ETH");
  EXPECT_EQ(docket::format::format_eth_value("1000050000000000000"),
            "1.0001 ETH");
  EXPECT_EQ(docket::format::format_eth_value("1234500000000000000000"),
            "1,234.5 ETH");
}

TEST(number, format_eth_value_keeps_unparseable_input) {
  EXPECT_EQ(docket::format::format_eth_value("lots"), "lots");
}
