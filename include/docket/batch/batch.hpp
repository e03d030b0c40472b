#pragma once
#include <docket/decoder/action_decoder.hpp>
#include <docket/schema/call_descriptor.hpp>
#include <docket/schema/decoded_action.hpp>
#include <docket/schema/primitives.hpp>

#include <functional>
#include <istream>
#include <string>
#include <thread>
#include <vector>

namespace docket::batch {

/// The ordered executable actions of one proposal or candidate.
using batch_t = std::vector<schema::call_descriptor>;

/// Zip the four parallel arrays a data source supplies. Longer arrays are
/// truncated to the shortest.
batch_t make_batch(const std::vector<std::string>& targets,
                   const std::vector<std::string>& values,
                   const std::vector<std::string>& signatures,
                   const std::vector<std::string>& calldatas);

/// Tab separated `target value signature calldata` lines. Blank lines and
/// lines starting with `#` are skipped; missing trailing fields are empty.
/// Lines with more than four fields are skipped with a warning.
batch_t read_batch(std::istream& input);

/// Decode every action, across `decoder.config().parallelism` threads when
/// more than one, then correlate the whole batch.
std::vector<schema::decoded_action> decode_batch(
    const decoder::action_decoder& decoder,
    const batch_t& batch);

using thread_launcher_t = std::function<std::thread(std::function<void()>)>;

/// As above, starting workers through `launch`. Workers that fail to start
/// with std::system_error are decoded on the calling thread.
std::vector<schema::decoded_action> decode_batch(
    const decoder::action_decoder& decoder,
    const batch_t& batch,
    const thread_launcher_t& launch);

/// Lowercase recipient addresses across the batch, first seen first, without
/// duplicates. Address arrays contribute each element.
std::vector<std::string> extract_recipients(
    const std::vector<schema::decoded_action>& actions);

/// `No actions`, the only summary, or the first two summaries followed by
/// `, and N more action(s)`.
std::string summarize(const std::vector<schema::decoded_action>& actions);

/// BLAKE3 over a length framed encoding of every descriptor field, in order.
schema::hash32_t fingerprint(const batch_t& batch);

}  // namespace docket::batch
