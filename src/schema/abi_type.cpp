#include <docket/schema/abi_type.hpp>

#include <numeric>

namespace docket::schema {

namespace {

std::string tuple_spelling(const abi_type& type) {
  auto out = std::string{"("};
  for (std::size_t i = 0; i < type.components.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += canonical_type(type.components[i]);
  }
  out += ")";
  return out;
}

}  // namespace

std::string canonical_type(const abi_type& type) {
  switch (type.kind) {
    case abi_kind::unsigned_integer:
      return "uint" + std::to_string(type.width);
    case abi_kind::signed_integer:
      return "int" + std::to_string(type.width);
    case abi_kind::address:
      return "address";
    case abi_kind::boolean:
      return "bool";
    case abi_kind::fixed_bytes:
      return "bytes" + std::to_string(type.width);
    case abi_kind::bytes:
      return "bytes";
    case abi_kind::string:
      return "string";
    case abi_kind::array: {
      auto element = type.components.empty()
                         ? std::string{}
                         : canonical_type(type.components.front());
      if (type.length) {
        return element + "[" + std::to_string(*type.length) + "]";
      }
      return element + "[]";
    }
    case abi_kind::tuple:
      return tuple_spelling(type);
  }
  return {};
}

std::string base_type(const abi_type& type) {
  if (type.kind == abi_kind::array) {
    if (type.components.empty()) {
      return {};
    }
    return base_type(type.components.front());
  }
  if (type.kind == abi_kind::tuple) {
    return "tuple";
  }
  return canonical_type(type);
}

bool is_dynamic(const abi_type& type) {
  switch (type.kind) {
    case abi_kind::bytes:
    case abi_kind::string:
      return true;
    case abi_kind::array:
      if (!type.length) {
        return true;
      }
      return !type.components.empty() && is_dynamic(type.components.front());
    case abi_kind::tuple:
      for (const auto& component : type.components) {
        if (is_dynamic(component)) {
          return true;
        }
      }
      return false;
    default:
      return false;
  }
}

std::size_t head_words(const abi_type& type) {
  if (is_dynamic(type)) {
    return 1;
  }
  if (type.kind == abi_kind::array) {
    if (type.components.empty() || !type.length) {
      return 1;
    }
    return *type.length * head_words(type.components.front());
  }
  if (type.kind == abi_kind::tuple) {
    return std::accumulate(std::begin(type.components),
                           std::end(type.components), std::size_t{0},
                           [](const std::size_t total, const abi_type& c) {
                             return total + head_words(c);
                           });
  }
  return 1;
}

}  // namespace docket::schema
