#pragma once
#include <docket/schema/abi_type.hpp>
#include <docket/schema/function_schema.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docket::abi {

/// Parse a Solidity type (`uint`, `bytes32`, `address[]`,
/// `tuple(address to, uint256 amount)[2]`). Returns nullopt for anything that
/// is not a valid ABI type.
std::optional<schema::abi_type> parse_type(std::string_view text);

/// Parse one human-readable ABI function fragment:
/// `function <name>(<type> [<name>], ...) [modifiers] [returns (...)]`.
/// The leading `function` keyword is optional. The selector is left empty.
std::optional<schema::function_schema> parse_function(std::string_view text);

std::string canonical_signature(const schema::function_schema& function);

/// Text before the first `(`, trimmed. The whole trimmed input when there is
/// no parenthesis.
std::string function_name_of(std::string_view signature);

/// Flat split on commas of the text between the first `(` and the next `)`.
/// Nested groups are not interpreted. Nullopt when the signature has no
/// parenthesis group.
std::optional<std::vector<std::string>> split_signature_types(
    std::string_view signature);

std::vector<std::string_view> split_top_level(std::string_view text);

std::string_view trim(std::string_view text);

}  // namespace docket::abi
