#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace docket::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using selector_t = std::array<uint8_t, 4>;
using word_t = std::array<uint8_t, 32>;
using uint256_t = boost::multiprecision::uint256_t;
using big_int_t = boost::multiprecision::cpp_int;

inline constexpr auto kWordSize = std::size_t{32};

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_view_t& bytes);

std::string_view normalize_hex(std::string_view input);

std::string to_hex(const bytes_view_t& bytes);
std::string to_prefixed_hex(const bytes_view_t& bytes);

std::optional<bytes_t> try_from_hex(std::string_view hex);

std::optional<address_t> try_make_address(std::string_view hex);
std::optional<selector_t> try_make_selector(std::string_view hex);

std::string to_string(const address_t& address);
std::string to_string(const selector_t& selector);

std::string normalize_address(std::string_view address);

/// `0x1234...abcd` form used in summaries.
std::string truncate_address(std::string_view address);

std::string to_lower(std::string_view value);

}  // namespace docket::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
