#include <docket/abi/type_parser.hpp>
#include <docket/registry/schema_bundle.hpp>

#include <spdlog/spdlog.h>

#include <fstream>
#include <string>
#include <vector>

namespace docket::registry {

namespace {

constexpr auto kBundleFields = std::size_t{5};

std::vector<std::string_view> split_fields(const std::string_view line) {
  auto out = std::vector<std::string_view>{};
  auto start = std::size_t{0};
  for (std::size_t i = 0; i <= line.size(); ++i) {
    auto end = i == line.size();
    if (end || (line[i] == '|' && out.size() + 1 < kBundleFields)) {
      out.push_back(abi::trim(line.substr(start, i - start)));
      start = i + 1;
    }
  }
  return out;
}

}  // namespace

std::size_t load_bundle(schema_registry& registry, std::istream& input) {
  auto registered = std::size_t{0};
  auto line = std::string{};
  auto line_number = std::size_t{0};
  while (std::getline(input, line)) {
    ++line_number;
    auto text = abi::trim(line);
    if (text.empty() || text.starts_with("#")) {
      continue;
    }
    auto fields = split_fields(text);
    if (fields.size() != kBundleFields) {
      spdlog::warn("Schema bundle line {}: expected {} fields, found {}",
                   line_number, kBundleFields, fields.size());
      continue;
    }
    auto category = schema::try_contract_category_from_string(fields[1]);
    if (!category) {
      spdlog::warn("Schema bundle line {}: unknown category '{}'", line_number,
                   fields[1]);
      continue;
    }
    if (registry.register_schema(fields[0], fields[2], fields[3], fields[4],
                                 *category)) {
      ++registered;
    }
  }
  spdlog::info("Loaded {} contract schema(s) from bundle", registered);
  return registered;
}

std::optional<std::size_t> load_bundle_file(schema_registry& registry,
                                            const std::filesystem::path& path) {
  auto input = std::ifstream{path};
  if (!input) {
    spdlog::error("Unable to open schema bundle '{}'", path.string());
    return std::nullopt;
  }
  return load_bundle(registry, input);
}

}  // namespace docket::registry
