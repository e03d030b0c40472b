#pragma once

#include <docket/schema/contract_category.hpp>
#include <docket/schema/contract_schema_entry.hpp>
#include <docket/schema/function_schema.hpp>
#include <docket/schema/primitives.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace docket::registry {

/// Address keyed table of known contract schemas.
///
/// Readers take a shared lock and writers an exclusive one, so decoding may
/// run on many threads while schemas discovered at runtime are registered.
/// Entries are immutable once stored; lookups hand out shared ownership of
/// the stored entry.
class schema_registry final {
 public:
  /// Construct a registry seeded with the built-in contracts. Pass false for
  /// an empty registry.
  explicit schema_registry(bool seed_builtins = true);

  schema_registry(const schema_registry&) = delete;
  schema_registry& operator=(const schema_registry&) = delete;

  /// Entry for `address` (any case, `0x` optional) or nullptr.
  std::shared_ptr<const schema::contract_schema_entry> lookup(
      std::string_view address) const;

  /// Function by exact signature, then by canonicalized signature
  /// (`transfer(address,uint)` finds `transfer(address,uint256)`).
  std::optional<schema::function_schema> lookup_function(
      std::string_view address,
      std::string_view signature) const;

  std::optional<schema::function_schema> lookup_function_by_selector(
      std::string_view address,
      const schema::selector_t& selector) const;

  /// Add or replace a runtime entry. Fails (logged, no change) for an invalid
  /// address or when the address belongs to a built-in entry. Missing
  /// selectors are computed when a Keccak-256 digest is available.
  bool register_entry(schema::contract_schema_entry entry);

  /// Parse `raw_definition` (human-readable ABI fragments separated by
  /// newlines or `;`) and register the result. Any malformed fragment makes
  /// the whole registration a no-op.
  bool register_schema(std::string_view address,
                       std::string_view name,
                       std::string_view description,
                       std::string_view raw_definition,
                       schema::contract_category category =
                           schema::contract_category::known_external);

  /// Drop every entry registered at runtime. Built-in entries stay.
  void clear_external();

  /// Bumped by every mutation; cached decode results keyed on an older value
  /// are stale.
  uint64_t generation() const;

  std::size_t size() const;

 private:
  void insert(schema::contract_schema_entry entry);

  mutable std::shared_mutex mutex_;
  std::map<std::string, std::shared_ptr<const schema::contract_schema_entry>>
      entries_;
  uint64_t generation_{0};
};

}  // namespace docket::registry
