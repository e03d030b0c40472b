#pragma once
#include <docket/registry/schema_registry.hpp>

#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>

namespace docket::registry {

/// Register every contract of a schema bundle, one per line:
/// `address | category | name | description | fragment; fragment; ...`.
/// Blank lines and `#` comments are skipped; malformed lines are logged and
/// skipped. Returns the number of contracts registered.
std::size_t load_bundle(schema_registry& registry, std::istream& input);

/// Nullopt when the file cannot be opened.
std::optional<std::size_t> load_bundle_file(schema_registry& registry,
                                            const std::filesystem::path& path);

}  // namespace docket::registry
