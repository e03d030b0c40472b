#include <docket/abi/decoder.hpp>

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>

#include <algorithm>

namespace docket::abi {

namespace {

using schema::abi_kind;
using schema::abi_type;
using schema::big_int_t;
using schema::bytes_view_t;
using schema::decoded_value;
using schema::kWordSize;

bytes_view_t read_word(const bytes_view_t& data, const std::size_t at) {
  if (at > data.size() || data.size() - at < kWordSize) {
    throw decode_error{
        fmt::format("word at {} exceeds payload of {} bytes", at, data.size())};
  }
  return data.subspan(at, kWordSize);
}

// Offsets and lengths must fit inside the payload.
std::size_t read_size(const bytes_view_t& data, const std::size_t at) {
  auto value = to_unsigned(read_word(data, at));
  if (value > data.size()) {
    throw decode_error{fmt::format("size {} at {} exceeds payload",
                                   value.str(), at)};
  }
  return value.convert_to<std::size_t>();
}

// Decoded bytes allowed per payload byte. Dynamic values may share a tail.
constexpr auto kDecodeBudgetFactor = std::size_t{4};

struct decode_state final {
  bytes_view_t data;
  std::size_t budget{0};
};

void charge(decode_state& state, const std::size_t bytes) {
  if (bytes > state.budget) {
    throw decode_error{fmt::format(
        "decoded values exceed {} times the payload of {} bytes",
        kDecodeBudgetFactor, state.data.size())};
  }
  state.budget -= bytes;
}

decoded_value decode_value(const abi_type& type,
                           decode_state& state,
                           std::size_t at);

std::vector<decoded_value> decode_sequence(
    const std::vector<abi_type>& types,
    decode_state& state,
    const std::size_t base) {
  auto out = std::vector<decoded_value>{};
  out.reserve(types.size());
  auto position = base;
  for (const auto& type : types) {
    if (schema::is_dynamic(type)) {
      auto offset = read_size(state.data, position);
      out.push_back(decode_value(type, state, base + offset));
      position += kWordSize;
    } else {
      out.push_back(decode_value(type, state, position));
      position += schema::head_words(type) * kWordSize;
    }
  }
  return out;
}

schema::bytes_t read_dynamic_bytes(decode_state& state, const std::size_t at) {
  const auto& data = state.data;
  auto length = read_size(data, at);
  auto start = at + kWordSize;
  if (start > data.size() || data.size() - start < length) {
    throw decode_error{fmt::format("{} bytes at {} exceed payload of {} bytes",
                                   length, start, data.size())};
  }
  charge(state, length);
  return schema::make_bytes(data.subspan(start, length));
}

decoded_value decode_value(const abi_type& type,
                           decode_state& state,
                           const std::size_t at) {
  const auto& data = state.data;
  if (type.kind != abi_kind::array && type.kind != abi_kind::tuple) {
    charge(state, kWordSize);
  }
  switch (type.kind) {
    case abi_kind::unsigned_integer:
      return decoded_value{to_unsigned(read_word(data, at), type.width)};
    case abi_kind::signed_integer:
      return decoded_value{to_signed(read_word(data, at), type.width)};
    case abi_kind::address:
      return decoded_value{to_address(read_word(data, at))};
    case abi_kind::boolean: {
      auto word = read_word(data, at);
      return decoded_value{
          std::ranges::any_of(word, [](const uint8_t b) { return b != 0; })};
    }
    case abi_kind::fixed_bytes:
      return decoded_value{
          schema::make_bytes(read_word(data, at).first(type.width))};
    case abi_kind::bytes:
      return decoded_value{read_dynamic_bytes(state, at)};
    case abi_kind::string: {
      auto raw = read_dynamic_bytes(state, at);
      return decoded_value{schema::make_string(raw)};
    }
    case abi_kind::array: {
      if (type.components.empty()) {
        throw decode_error{"array type without element type"};
      }
      auto count = std::size_t{};
      auto start = at;
      if (type.length) {
        count = *type.length;
      } else {
        count = read_size(data, at);
        start = at + kWordSize;
      }
      // Every element occupies at least one head word.
      if (count > (data.size() / kWordSize)) {
        throw decode_error{
            fmt::format("array of {} elements exceeds payload", count)};
      }
      auto elements =
          std::vector<abi_type>(count, type.components.front());
      return decoded_value{decode_sequence(elements, state, start)};
    }
    case abi_kind::tuple: {
      auto values = decode_sequence(type.components, state, at);
      auto fields = schema::decoded_tuple_t{};
      fields.reserve(values.size());
      for (std::size_t i = 0; i < values.size(); ++i) {
        auto name = i < type.component_names.size() ? type.component_names[i]
                                                    : std::string{};
        fields.push_back(schema::tuple_field{.name = std::move(name),
                                             .value = std::move(values[i])});
      }
      return decoded_value{std::move(fields)};
    }
  }
  throw decode_error{"unsupported type"};
}

}  // namespace

std::vector<schema::decoded_value> decode(const std::vector<abi_type>& types,
                                          const bytes_view_t& data) {
  auto state = decode_state{.data = data,
                            .budget = kDecodeBudgetFactor * data.size()};
  return decode_sequence(types, state, 0);
}

big_int_t to_unsigned(const bytes_view_t& word, const uint16_t bits) {
  auto value = big_int_t{};
  boost::multiprecision::import_bits(value, word.begin(), word.end());
  if (bits < 256) {
    value &= (big_int_t{1} << bits) - 1;
  }
  return value;
}

big_int_t to_signed(const bytes_view_t& word, const uint16_t bits) {
  auto value = to_unsigned(word, bits);
  if (bits > 0 && boost::multiprecision::bit_test(value, bits - 1u)) {
    value -= big_int_t{1} << bits;
  }
  return value;
}

schema::address_t to_address(const bytes_view_t& word) {
  auto out = schema::address_t{};
  if (word.size() >= out.size()) {
    std::copy(word.end() - static_cast<std::ptrdiff_t>(out.size()), word.end(),
              out.begin());
  }
  return out;
}

}  // namespace docket::abi
