#pragma once
#include <docket/registry/schema_registry.hpp>
#include <docket/schema/abi_type.hpp>
#include <docket/schema/decoded_value.hpp>

#include <string>

namespace docket::format {

/// Turns decoded ABI values into display strings.
///
/// Arrays show up to three elements, otherwise `[N items]`. Integers are
/// grouped. Addresses known to the registry gain their contract name. Byte
/// strings over 32 bytes and text over 50 characters are shortened. Tuples
/// show their first two fields.
class value_formatter final {
 public:
  explicit value_formatter(const registry::schema_registry& registry);

  std::string format(const schema::decoded_value& value,
                     const schema::abi_type& type) const;

  std::string format_address(const schema::address_t& address) const;

  static std::string format_bytes(const schema::bytes_t& bytes);

  /// Past 50 UTF-8 characters, the first 47 followed by `...`.
  static std::string format_text(const std::string& text);

 private:
  const registry::schema_registry& registry_;
};

}  // namespace docket::format
