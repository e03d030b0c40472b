#include <docket/abi/type_parser.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>

namespace docket::abi {

namespace {

constexpr auto kIgnoredModifiers = std::array<std::string_view, 5>{
    "indexed", "memory", "calldata", "storage", "payable"};

bool is_space(const char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_identifier(const std::string_view text) {
  if (text.empty() || std::isdigit(static_cast<unsigned char>(text[0])) != 0) {
    return false;
  }
  return std::ranges::all_of(text, [](const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' ||
           c == '$';
  });
}

std::size_t find_closing(const std::string_view text, const std::size_t open) {
  auto depth = std::size_t{0};
  for (auto i = open; i < text.size(); ++i) {
    if (text[i] == '(') {
      ++depth;
    } else if (text[i] == ')') {
      if (depth == 0) {
        return std::string_view::npos;
      }
      if (--depth == 0) {
        return i;
      }
    }
  }
  return std::string_view::npos;
}

std::optional<std::size_t> parse_number(const std::string_view text) {
  auto value = std::size_t{};
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end || text.empty()) {
    return std::nullopt;
  }
  return value;
}

std::optional<uint16_t> parse_width(const std::string_view suffix,
                                    const uint16_t fallback,
                                    const uint16_t step,
                                    const uint16_t max) {
  if (suffix.empty()) {
    return fallback;
  }
  auto width = parse_number(suffix);
  if (!width || *width == 0 || *width > max || (*width % step) != 0) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*width);
}

std::optional<schema::abi_type> parse_elementary(const std::string_view text) {
  using schema::abi_kind;
  if (text == "address") {
    return schema::abi_type{.kind = abi_kind::address};
  }
  if (text == "bool") {
    return schema::abi_type{.kind = abi_kind::boolean};
  }
  if (text == "string") {
    return schema::abi_type{.kind = abi_kind::string};
  }
  if (text == "bytes") {
    return schema::abi_type{.kind = abi_kind::bytes};
  }
  if (text.starts_with("bytes")) {
    auto width = parse_width(text.substr(5), 0, 1, 32);
    if (!width || *width == 0) {
      return std::nullopt;
    }
    return schema::abi_type{.kind = abi_kind::fixed_bytes, .width = *width};
  }
  if (text.starts_with("uint")) {
    auto width = parse_width(text.substr(4), 256, 8, 256);
    if (!width) {
      return std::nullopt;
    }
    return schema::abi_type{.kind = abi_kind::unsigned_integer,
                            .width = *width};
  }
  if (text.starts_with("int")) {
    auto width = parse_width(text.substr(3), 256, 8, 256);
    if (!width) {
      return std::nullopt;
    }
    return schema::abi_type{.kind = abi_kind::signed_integer, .width = *width};
  }
  return std::nullopt;
}

struct parsed_parameter final {
  schema::abi_type type;
  std::string name;
};

// `<type> [modifiers] [name]` where type may be a parenthesised tuple.
std::optional<parsed_parameter> parse_parameter(std::string_view text) {
  text = trim(text);
  if (text.empty()) {
    return std::nullopt;
  }

  auto type_end = std::size_t{0};
  auto tuple_start = std::string_view::npos;
  if (text.starts_with("(")) {
    tuple_start = 0;
  } else if (text.starts_with("tuple")) {
    auto rest = text.find_first_not_of(" \t", 5);
    if (rest != std::string_view::npos && text[rest] == '(') {
      tuple_start = rest;
    }
  }

  if (tuple_start != std::string_view::npos) {
    auto close = find_closing(text, tuple_start);
    if (close == std::string_view::npos) {
      return std::nullopt;
    }
    type_end = close + 1;
    while (type_end < text.size() && text[type_end] == '[') {
      auto bracket = text.find(']', type_end);
      if (bracket == std::string_view::npos) {
        return std::nullopt;
      }
      type_end = bracket + 1;
    }
  } else {
    while (type_end < text.size() && !is_space(text[type_end])) {
      ++type_end;
    }
  }

  auto type_text = text.substr(0, type_end);
  if (tuple_start != std::string_view::npos && tuple_start > 0) {
    type_text = text.substr(tuple_start, type_end - tuple_start);
  }
  auto type = parse_type(type_text);
  if (!type) {
    return std::nullopt;
  }

  auto name = std::string{};
  auto rest = trim(text.substr(type_end));
  while (!rest.empty()) {
    auto token_end = std::size_t{0};
    while (token_end < rest.size() && !is_space(rest[token_end])) {
      ++token_end;
    }
    auto token = rest.substr(0, token_end);
    rest = trim(rest.substr(token_end));
    if (std::ranges::find(kIgnoredModifiers, token) !=
        std::end(kIgnoredModifiers)) {
      continue;
    }
    if (!is_identifier(token) || !name.empty()) {
      return std::nullopt;
    }
    name = std::string{token};
  }
  return parsed_parameter{.type = std::move(*type), .name = std::move(name)};
}

}  // namespace

std::string_view trim(std::string_view text) {
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

std::vector<std::string_view> split_top_level(const std::string_view text) {
  auto out = std::vector<std::string_view>{};
  auto depth = 0;
  auto start = std::size_t{0};
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '(') {
      ++depth;
    } else if (text[i] == ')') {
      --depth;
    } else if (text[i] == ',' && depth == 0) {
      out.push_back(text.substr(start, i - start));
      start = i + 1;
    }
  }
  out.push_back(text.substr(start));
  return out;
}

std::optional<schema::abi_type> parse_type(std::string_view text) {
  text = trim(text);
  if (text.empty()) {
    return std::nullopt;
  }

  if (text.ends_with("]")) {
    auto open = text.rfind('[');
    if (open == std::string_view::npos || open == 0) {
      return std::nullopt;
    }
    auto element = parse_type(text.substr(0, open));
    if (!element) {
      return std::nullopt;
    }
    auto inner = text.substr(open + 1, text.size() - open - 2);
    auto type = schema::abi_type{.kind = schema::abi_kind::array};
    if (!inner.empty()) {
      auto length = parse_number(inner);
      if (!length || *length == 0) {
        return std::nullopt;
      }
      type.length = *length;
    }
    type.components.push_back(std::move(*element));
    return type;
  }

  if (text.starts_with("tuple")) {
    text = trim(text.substr(5));
  }
  if (text.starts_with("(")) {
    if (find_closing(text, 0) != text.size() - 1) {
      return std::nullopt;
    }
    auto type = schema::abi_type{.kind = schema::abi_kind::tuple};
    auto inner = trim(text.substr(1, text.size() - 2));
    if (inner.empty()) {
      return type;
    }
    for (const auto& piece : split_top_level(inner)) {
      auto parameter = parse_parameter(piece);
      if (!parameter) {
        return std::nullopt;
      }
      type.components.push_back(std::move(parameter->type));
      type.component_names.push_back(std::move(parameter->name));
    }
    return type;
  }

  return parse_elementary(text);
}

std::optional<schema::function_schema> parse_function(std::string_view text) {
  text = trim(text);
  if (text.starts_with("function ") || text.starts_with("function\t")) {
    text = trim(text.substr(8));
  }

  auto open = text.find('(');
  if (open == std::string_view::npos) {
    return std::nullopt;
  }
  auto name = trim(text.substr(0, open));
  if (!is_identifier(name)) {
    return std::nullopt;
  }
  auto close = find_closing(text, open);
  if (close == std::string_view::npos) {
    return std::nullopt;
  }

  // Modifiers and the returns clause only need to be well formed.
  auto tail = text.substr(close + 1);
  auto depth = 0;
  for (const auto c : tail) {
    depth += (c == '(') ? 1 : (c == ')') ? -1 : 0;
    if (depth < 0) {
      return std::nullopt;
    }
  }
  if (depth != 0) {
    return std::nullopt;
  }

  auto function = schema::function_schema{.name = std::string{name}};
  auto inner = trim(text.substr(open + 1, close - open - 1));
  if (!inner.empty()) {
    for (const auto& piece : split_top_level(inner)) {
      auto parameter = parse_parameter(piece);
      if (!parameter) {
        return std::nullopt;
      }
      auto declared = schema::canonical_type(parameter->type);
      auto base = schema::base_type(parameter->type);
      function.parameters.push_back(
          schema::parameter_schema{.name = std::move(parameter->name),
                                   .declared_type = std::move(declared),
                                   .base_type = std::move(base),
                                   .type = std::move(parameter->type)});
    }
  }
  function.signature = canonical_signature(function);
  return function;
}

std::string canonical_signature(const schema::function_schema& function) {
  auto out = function.name + "(";
  for (std::size_t i = 0; i < function.parameters.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += schema::canonical_type(function.parameters[i].type);
  }
  out += ")";
  return out;
}

std::string function_name_of(const std::string_view signature) {
  auto open = signature.find('(');
  return std::string{trim(signature.substr(0, open))};
}

std::optional<std::vector<std::string>> split_signature_types(
    const std::string_view signature) {
  auto open = signature.find('(');
  if (open == std::string_view::npos) {
    return std::nullopt;
  }
  auto close = signature.find(')', open);
  if (close == std::string_view::npos || close < open) {
    return std::nullopt;
  }

  auto out = std::vector<std::string>{};
  auto inner = signature.substr(open + 1, close - open - 1);
  if (trim(inner).empty()) {
    return out;
  }
  auto start = std::size_t{0};
  for (std::size_t i = 0; i <= inner.size(); ++i) {
    if (i == inner.size() || inner[i] == ',') {
      out.emplace_back(trim(inner.substr(start, i - start)));
      start = i + 1;
    }
  }
  return out;
}

}  // namespace docket::abi
