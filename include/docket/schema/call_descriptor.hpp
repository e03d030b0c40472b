#pragma once
#include <string>

namespace docket::schema {

struct call_descriptor final {
  std::string target;
  // Wei, decimal string.
  std::string value;
  std::string signature;
  // `0x` prefixed hex, possibly just `0x`.
  std::string calldata;

  bool operator==(const call_descriptor&) const = default;
};

}  // namespace docket::schema
