#pragma once
#include <docket/config/decoder_config.hpp>
#include <docket/decoder/manual_decoder.hpp>
#include <docket/decoder/schema_decoder.hpp>
#include <docket/format/decimals_strategy.hpp>
#include <docket/registry/schema_registry.hpp>
#include <docket/schema/call_descriptor.hpp>
#include <docket/schema/decoded_action.hpp>

namespace docket::decoder {

/// Turns one call descriptor into a display-ready decoded action.
///
/// The contract is identified through the registry; parameters come from the
/// schema decoder when a registered function matches and decodes cleanly,
/// otherwise from the manual decoder. The result carries a summary,
/// category, severity and the addresses a caller may want resolved to names.
///
/// `decode` is total: no input, however malformed, makes it throw. The
/// registry is only read, so one decoder may serve many threads while the
/// registry keeps accepting registrations.
class action_decoder final {
 public:
  explicit action_decoder(const registry::schema_registry& registry,
                          config::decoder_config config = {});

  action_decoder(const action_decoder&) = delete;
  action_decoder& operator=(const action_decoder&) = delete;

  schema::decoded_action decode(
      const schema::call_descriptor& descriptor) const;

  const registry::schema_registry& registry() const;
  const config::decoder_config& config() const;

 private:
  schema::decoded_action decode_unchecked(
      const schema::call_descriptor& descriptor) const;

  const registry::schema_registry& registry_;
  config::decoder_config config_;
  format::decimals_strategy decimals_;
  schema_decoder schema_decoder_;
  manual_decoder manual_decoder_;
};

}  // namespace docket::decoder
