#pragma once
#include <docket/format/decimals_strategy.hpp>
#include <docket/format/value_formatter.hpp>
#include <docket/registry/schema_registry.hpp>
#include <docket/schema/call_descriptor.hpp>
#include <docket/schema/decoded_parameter.hpp>
#include <docket/schema/function_schema.hpp>

#include <optional>
#include <vector>

namespace docket::decoder {

struct schema_decode_result final {
  schema::function_schema function;
  std::vector<schema::decoded_parameter> parameters;
};

/// Decodes calldata against the function schemas registered for the target.
///
/// The function is resolved by signature when one is supplied, otherwise by
/// the leading selector of the calldata. Calldata may arrive with or without
/// the selector. Any structural decode failure yields nullopt so the caller
/// can fall back to the manual decoder; partial results are never returned.
class schema_decoder final {
 public:
  schema_decoder(const registry::schema_registry& registry,
                 const format::decimals_strategy& decimals);

  std::optional<schema_decode_result> decode(
      const schema::call_descriptor& descriptor) const;

 private:
  const registry::schema_registry& registry_;
  const format::decimals_strategy& decimals_;
  format::value_formatter formatter_;
};

/// Parameter words of `calldata` for `function`.
///
/// With a known selector the payload is taken as selector-prefixed when it
/// starts with the selector and the remainder is word aligned, and as
/// parameter-only when the whole payload is word aligned. Without a selector
/// only the alignment decides.
schema::bytes_view_t parameter_data(const schema::function_schema& function,
                                    const schema::bytes_view_t& calldata);

}  // namespace docket::decoder
