#include <docket/format/number.hpp>

#include <algorithm>
#include <cctype>

namespace docket::format {

namespace {

using schema::big_int_t;

big_int_t pow10(const unsigned exponent) {
  return boost::multiprecision::pow(big_int_t{10}, exponent);
}

std::string group_unsigned(const std::string& digits) {
  auto out = std::string{};
  out.reserve(digits.size() + (digits.size() / 3));
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (i > 0 && ((digits.size() - i) % 3) == 0) {
      out.push_back(',');
    }
    out.push_back(digits[i]);
  }
  return out;
}

// 10^14 wei.
const auto kMinimumEthDisplay = big_int_t{100'000'000'000'000};

}  // namespace

std::string group_digits(const big_int_t& value) {
  if (value < 0) {
    return "-" + group_unsigned(big_int_t{-value}.str());
  }
  return group_unsigned(value.str());
}

std::string format_scaled(const big_int_t& value,
                          const unsigned decimals,
                          const unsigned fraction_digits,
                          const bool group,
                          const bool trim_trailing_zeros) {
  auto negative = value < 0;
  auto magnitude = negative ? big_int_t{-value} : value;

  auto scaled = big_int_t{};
  if (fraction_digits < decimals) {
    auto divisor = pow10(decimals - fraction_digits);
    scaled = (magnitude + (divisor / 2)) / divisor;
  } else {
    scaled = magnitude * pow10(fraction_digits - decimals);
  }

  auto unit = pow10(fraction_digits);
  auto whole = big_int_t{scaled / unit};
  auto fraction = big_int_t{scaled % unit}.str();
  if (fraction_digits > 0 && fraction.size() < fraction_digits) {
    fraction.insert(0, fraction_digits - fraction.size(), '0');
  }
  if (fraction_digits == 0) {
    fraction.clear();
  }
  if (trim_trailing_zeros) {
    while (!fraction.empty() && fraction.back() == '0') {
      fraction.pop_back();
    }
  }

  auto out = group ? group_unsigned(whole.str()) : whole.str();
  if (!fraction.empty()) {
    out += "." + fraction;
  }
  if (negative && scaled != 0) {
    out.insert(0, "-");
  }
  return out;
}

std::string format_usd(const big_int_t& value, const unsigned decimals) {
  auto amount = format_scaled(value, decimals, 2, true, false);
  if (amount.starts_with("-")) {
    return "-$" + amount.substr(1);
  }
  return "$" + amount;
}

std::optional<big_int_t> try_parse_uint(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  auto hex =
      text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
  auto digits = hex ? text.substr(2) : text;
  auto valid = std::ranges::all_of(digits, [hex](const char c) {
    auto uc = static_cast<unsigned char>(c);
    return hex ? std::isxdigit(uc) != 0 : std::isdigit(uc) != 0;
  });
  if (!valid) {
    return std::nullopt;
  }
  if (hex) {
    return big_int_t{std::string{text}};
  }
  // A leading zero would otherwise be read as octal.
  auto first = digits.find_first_not_of('0');
  if (first == std::string_view::npos) {
    return big_int_t{0};
  }
  return big_int_t{std::string{digits.substr(first)}};
}

std::string format_eth_value(const std::string_view wei) {
  if (wei.empty() || wei == "0") {
    return "0 ETH";
  }
  auto value = try_parse_uint(wei);
  if (!value) {
    return std::string{wei};
  }
  if (*value == 0) {
    return "0 ETH";
  }
  if (*value < kMinimumEthDisplay) {
    return value->str() + " wei";
  }
  return format_scaled(*value, 18, 4, true, true) + " ETH";
}

}  // namespace docket::format
