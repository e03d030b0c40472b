#pragma once
#include <docket/config/decoder_config.hpp>
#include <docket/schema/action_category.hpp>
#include <docket/schema/action_severity.hpp>
#include <docket/schema/contract_schema_entry.hpp>
#include <docket/schema/decoded_action.hpp>

namespace docket::classify {

struct classification final {
  schema::action_category category{schema::action_category::unknown};
  schema::action_severity severity{schema::action_severity::normal};

  bool operator==(const classification&) const = default;
};

/// Category and severity of a decoded action.
///
/// Function shape decides first (ownership, upgrades and admin hand-overs are
/// critical; admin setters elevated), then the target's domain. Payments and
/// purchases above the configured thresholds are elevated. `entry` may be
/// null for unregistered targets.
classification classify_action(const schema::decoded_action& action,
                               const schema::contract_schema_entry* entry,
                               const config::decoder_config& config);

bool is_bare_eth_transfer(const schema::decoded_action& action);

}  // namespace docket::classify
