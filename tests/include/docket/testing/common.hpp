#pragma once

#include <docket/schema/primitives.hpp>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace docket::testing {

inline constexpr auto kAlice =
    std::string_view{"0x1111111111111111111111111111111111111111"};
inline constexpr auto kBob =
    std::string_view{"0x2222222222222222222222222222222222222222"};
inline constexpr auto kPredictedStream =
    std::string_view{"0xaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa"};
inline constexpr auto kUnknownContract =
    std::string_view{"0x3333333333333333333333333333333333333333"};

/// 64 hex characters encoding `value` as a uint256 word.
inline std::string word(const docket::schema::big_int_t& value) {
  auto hex = std::string{};
  if (value == 0) {
    hex = "0";
  } else {
    auto remaining = value;
    while (remaining > 0) {
      auto nibble =
          docket::schema::big_int_t{remaining % 16}.convert_to<unsigned>();
      hex.insert(hex.begin(), "0123456789abcdef"[nibble]);
      remaining /= 16;
    }
  }
  return std::string(64 - hex.size(), '0') + hex;
}

inline std::string word(const uint64_t value) {
  return word(docket::schema::big_int_t{value});
}

inline std::string address_word(const std::string_view address) {
  auto hex = docket::schema::normalize_hex(address);
  return std::string(64 - hex.size(), '0') + std::string{hex};
}

/// `0x` + selector + words.
inline std::string calldata(const std::string_view selector,
                            std::initializer_list<std::string> words) {
  auto out = "0x" + std::string{selector};
  for (const auto& w : words) {
    out += w;
  }
  return out;
}

/// `0x` + words, selector omitted.
inline std::string parameters_only(std::initializer_list<std::string> words) {
  return calldata("", words);
}

inline docket::schema::bytes_t bytes_of(const std::string_view hex) {
  auto decoded = docket::schema::try_from_hex(hex);
  return decoded ? *decoded : docket::schema::bytes_t{};
}

}  // namespace docket::testing
