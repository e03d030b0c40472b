#pragma once
#include <docket/format/decimals_strategy.hpp>
#include <docket/format/value_formatter.hpp>
#include <docket/schema/call_descriptor.hpp>
#include <docket/schema/decoded_parameter.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace docket::decoder {

/// Best-effort decoder for calls without a registered schema.
///
/// Parameter types come from a flat comma split of the signature; the
/// payload is read as one 32-byte word per type. Only `address`, integer,
/// `bool` and `bytesN` words are interpreted; anything else, and any word the
/// payload is too short to supply, is kept as opaque hex. Never throws.
class manual_decoder final {
 public:
  manual_decoder(const registry::schema_registry& registry,
                 const format::decimals_strategy& decimals);

  std::vector<schema::decoded_parameter> decode(
      const schema::call_descriptor& descriptor,
      std::string_view function_name) const;

 private:
  const format::decimals_strategy& decimals_;
  format::value_formatter formatter_;
};

std::string fallback_parameter_name(std::string_view function,
                                    std::size_t index);

}  // namespace docket::decoder
