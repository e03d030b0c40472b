#pragma once
#include <docket/schema/decoded_action.hpp>

#include <map>
#include <string>
#include <vector>

namespace docket::correlation {

/// Lowercase predicted stream address to the index of the action creating it.
/// A later creation of the same address wins.
std::map<std::string, std::size_t> scan_stream_creations(
    const std::vector<schema::decoded_action>& actions);

/// Second pass over a fully decoded batch.
///
/// A token transfer categorized as payment, or a debt registration, whose
/// recipient is the predicted address of a stream created in the same batch
/// is rewritten as funding that stream: category `stream`, a `Fund stream #n`
/// summary and a recipient role naming the creating action (1-based). Every
/// other action is returned unchanged.
std::vector<schema::decoded_action> correlate(
    std::vector<schema::decoded_action> actions);

}  // namespace docket::correlation
