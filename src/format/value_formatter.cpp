#include <docket/format/number.hpp>
#include <docket/format/value_formatter.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>

namespace docket::format {

namespace {

constexpr auto kMaxListedElements = std::size_t{3};
constexpr auto kMaxListedFields = std::size_t{2};
constexpr auto kMaxTextLength = std::size_t{50};
constexpr auto kMaxBytesLength = std::size_t{32};

// Formatting falls back to this when a value does not match its declared
// type.
const auto kOpaqueType = schema::abi_type{.kind = schema::abi_kind::bytes};

}  // namespace

value_formatter::value_formatter(const registry::schema_registry& registry)
    : registry_{registry} {}

std::string value_formatter::format_address(
    const schema::address_t& address) const {
  auto text = schema::to_string(address);
  if (auto entry = registry_.lookup(text); entry) {
    return fmt::format("{} ({})", text, entry->display_name);
  }
  return text;
}

std::string value_formatter::format_bytes(const schema::bytes_t& bytes) {
  auto hex = schema::to_prefixed_hex(bytes);
  if (bytes.size() <= kMaxBytesLength) {
    return hex;
  }
  return fmt::format("{}...{} ({} bytes)", hex.substr(0, 10),
                     hex.substr(hex.size() - 8), bytes.size());
}

std::string value_formatter::format_text(const std::string& text) {
  // Lengths count UTF-8 code points; continuation bytes are skipped.
  auto is_lead = [](const char c) {
    return (static_cast<uint8_t>(c) & 0xC0) != 0x80;
  };
  auto length = std::ranges::count_if(text, is_lead);
  if (static_cast<std::size_t>(length) <= kMaxTextLength) {
    return text;
  }
  auto kept = std::size_t{0};
  auto cut = std::size_t{0};
  for (; cut < text.size(); ++cut) {
    if (is_lead(text[cut]) && kept++ == kMaxTextLength - 3) {
      break;
    }
  }
  return text.substr(0, cut) + "...";
}

std::string value_formatter::format(const schema::decoded_value& value,
                                    const schema::abi_type& type) const {
  return std::visit(
      overloaded{
          [](const schema::big_int_t& number) { return group_digits(number); },
          [this](const schema::address_t& address) {
            return format_address(address);
          },
          [](const bool flag) { return std::string{flag ? "true" : "false"}; },
          [](const schema::bytes_t& bytes) { return format_bytes(bytes); },
          [](const std::string& text) { return format_text(text); },
          [this, &type](const schema::decoded_array_t& elements) {
            if (elements.empty()) {
              return std::string{"[]"};
            }
            if (elements.size() > kMaxListedElements) {
              return fmt::format("[{} items]", elements.size());
            }
            auto typed = type.kind == schema::abi_kind::array &&
                         !type.components.empty();
            const auto& element_type =
                typed ? type.components.front() : kOpaqueType;
            auto out = std::string{"["};
            for (std::size_t i = 0; i < elements.size(); ++i) {
              if (i > 0) {
                out += ", ";
              }
              out += format(elements[i], element_type);
            }
            return out + "]";
          },
          [this, &type](const schema::decoded_tuple_t& fields) {
            if (fields.empty()) {
              return std::string{"{}"};
            }
            auto out = std::string{"{ "};
            auto shown = std::min(fields.size(), kMaxListedFields);
            for (std::size_t i = 0; i < shown; ++i) {
              if (i > 0) {
                out += ", ";
              }
              const auto& field_type = i < type.components.size()
                                           ? type.components[i]
                                           : kOpaqueType;
              auto name = fields[i].name.empty() ? fmt::format("{}", i)
                                                 : fields[i].name;
              out += name + ": " + format(fields[i].value, field_type);
            }
            if (fields.size() > kMaxListedFields) {
              out += "...";
            }
            return out + " }";
          },
      },
      value.value);
}

}  // namespace docket::format
