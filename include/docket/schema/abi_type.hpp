#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace docket::schema {

enum class abi_kind : uint8_t {
  unsigned_integer = 0,
  signed_integer = 1,
  address = 2,
  boolean = 3,
  fixed_bytes = 4,
  bytes = 5,
  string = 6,
  array = 7,
  tuple = 8
};

struct abi_type final {
  abi_kind kind{abi_kind::unsigned_integer};
  // Bit width for integers, byte width for fixed bytes.
  uint16_t width{};
  // Fixed array length; empty for dynamic arrays.
  std::optional<std::size_t> length;
  // Element type for arrays, fields for tuples.
  std::vector<abi_type> components;
  // Field names for tuples, empty strings when unnamed.
  std::vector<std::string> component_names;

  bool operator==(const abi_type&) const = default;
};

std::string canonical_type(const abi_type& type);

std::string base_type(const abi_type& type);

/// True when the type is head/tail encoded (bytes, string, dynamic arrays and
/// anything containing them).
bool is_dynamic(const abi_type& type);

std::size_t head_words(const abi_type& type);

}  // namespace docket::schema
