#include <docket/abi/type_parser.hpp>
#include <docket/crypto/keccak.hpp>
#include <docket/registry/builtin_contracts.hpp>
#include <docket/registry/schema_registry.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <mutex>
#include <vector>

namespace docket::registry {

namespace {

constexpr auto kSkippedFragmentKinds = std::array<std::string_view, 5>{
    "event ", "error ", "constructor", "fallback", "receive"};

std::optional<std::string> canonical_address(const std::string_view address) {
  if (!schema::try_make_address(address)) {
    return std::nullopt;
  }
  return schema::normalize_address(address);
}

std::vector<std::string_view> split_fragments(const std::string_view raw) {
  auto out = std::vector<std::string_view>{};
  auto start = std::size_t{0};
  for (std::size_t i = 0; i <= raw.size(); ++i) {
    if (i == raw.size() || raw[i] == '\n' || raw[i] == ';') {
      auto fragment = abi::trim(raw.substr(start, i - start));
      if (!fragment.empty() && !fragment.starts_with("#")) {
        out.push_back(fragment);
      }
      start = i + 1;
    }
  }
  return out;
}

bool is_skipped_fragment(const std::string_view fragment) {
  for (const auto& kind : kSkippedFragmentKinds) {
    if (fragment.starts_with(kind)) {
      return true;
    }
  }
  return false;
}

void fill_selectors(schema::contract_schema_entry& entry) {
  auto missing = false;
  for (auto& [signature, function] : entry.functions) {
    if (function.selector) {
      continue;
    }
    function.selector = crypto::selector(signature);
    missing = missing || !function.selector;
  }
  if (missing) {
    spdlog::warn(
        "Keccak-256 unavailable; {} ({}) registered without selectors, "
        "selector lookups will not match it",
        entry.display_name, entry.address);
  }
}

}  // namespace

schema_registry::schema_registry(const bool seed_builtins) {
  if (!seed_builtins) {
    return;
  }
  for (auto& entry : builtin_contracts()) {
    insert(std::move(entry));
  }
  spdlog::info("Schema registry seeded with {} built-in contract(s)",
               entries_.size());
}

void schema_registry::insert(schema::contract_schema_entry entry) {
  auto key = entry.address;
  entries_.insert_or_assign(
      std::move(key),
      std::make_shared<const schema::contract_schema_entry>(std::move(entry)));
  ++generation_;
}

std::shared_ptr<const schema::contract_schema_entry> schema_registry::lookup(
    const std::string_view address) const {
  auto key = schema::normalize_address(address);
  auto lock = std::shared_lock{mutex_};
  auto it = entries_.find(key);
  if (it == std::end(entries_)) {
    return nullptr;
  }
  return it->second;
}

std::optional<schema::function_schema> schema_registry::lookup_function(
    const std::string_view address,
    const std::string_view signature) const {
  auto entry = lookup(address);
  if (!entry) {
    return std::nullopt;
  }
  auto key = std::string{abi::trim(signature)};
  if (auto it = entry->functions.find(key); it != std::end(entry->functions)) {
    return it->second;
  }
  auto parsed = abi::parse_function(key);
  if (!parsed) {
    return std::nullopt;
  }
  if (auto it = entry->functions.find(parsed->signature);
      it != std::end(entry->functions)) {
    return it->second;
  }
  return std::nullopt;
}

std::optional<schema::function_schema>
schema_registry::lookup_function_by_selector(
    const std::string_view address,
    const schema::selector_t& selector) const {
  auto entry = lookup(address);
  if (!entry) {
    return std::nullopt;
  }
  for (const auto& [signature, function] : entry->functions) {
    if (function.selector == selector) {
      return function;
    }
  }
  return std::nullopt;
}

bool schema_registry::register_entry(schema::contract_schema_entry entry) {
  auto address = canonical_address(entry.address);
  if (!address) {
    spdlog::warn("Rejecting schema registration for invalid address '{}'",
                 entry.address);
    return false;
  }
  entry.address = *address;
  entry.builtin = false;
  fill_selectors(entry);

  auto lock = std::unique_lock{mutex_};
  if (auto it = entries_.find(entry.address);
      it != std::end(entries_) && it->second->builtin) {
    spdlog::warn("Rejecting schema registration that shadows built-in {} ({})",
                 it->second->display_name, entry.address);
    return false;
  }
  spdlog::debug("Registered {} function schema(s) for {} ({})",
                entry.functions.size(), entry.display_name, entry.address);
  insert(std::move(entry));
  return true;
}

bool schema_registry::register_schema(
    const std::string_view address,
    const std::string_view name,
    const std::string_view description,
    const std::string_view raw_definition,
    const schema::contract_category category) {
  auto entry = schema::contract_schema_entry{
      .address = std::string{address},
      .display_name = std::string{name},
      .description = std::string{description},
      .category = category,
  };
  for (const auto& fragment : split_fragments(raw_definition)) {
    if (is_skipped_fragment(fragment)) {
      continue;
    }
    auto function = abi::parse_function(fragment);
    if (!function) {
      spdlog::warn("Rejecting schema for {} ({}): malformed fragment '{}'",
                   name, address, fragment);
      return false;
    }
    auto signature = function->signature;
    entry.functions.insert_or_assign(std::move(signature),
                                     std::move(*function));
  }
  return register_entry(std::move(entry));
}

void schema_registry::clear_external() {
  auto lock = std::unique_lock{mutex_};
  auto removed = std::erase_if(entries_, [](const auto& item) {
    return !item.second->builtin;
  });
  if (removed > 0) {
    ++generation_;
  }
  spdlog::debug("Cleared {} runtime schema registration(s)", removed);
}

uint64_t schema_registry::generation() const {
  auto lock = std::shared_lock{mutex_};
  return generation_;
}

std::size_t schema_registry::size() const {
  auto lock = std::shared_lock{mutex_};
  return entries_.size();
}

}  // namespace docket::registry
