#pragma once

#include <docket/schema/primitives.hpp>

#include <boost/program_options.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docket::config {

/// `function:parameter=decimals:symbol`, e.g. `payBackDebt:amount=6:USD`.
/// A `USD` symbol renders amounts as dollars.
struct decimals_convention final {
  std::string function;
  std::string parameter;
  uint8_t decimals{18};
  std::string symbol;

  bool operator==(const decimals_convention&) const = default;
};

std::optional<decimals_convention> try_parse_convention(std::string_view text);

struct decoder_config final {
  // Manual fallback only: uint amounts above the threshold are shown as
  // generic tokens with the assumed decimals.
  bool generic_token_heuristic{true};
  schema::big_int_t generic_token_threshold{1'000'000'000'000'000};
  uint8_t generic_token_decimals{18};

  // Raw base units.
  schema::big_int_t elevated_usdc_payment{50'000'000'000};
  schema::big_int_t elevated_eth_transfer{
      schema::big_int_t{10} * schema::big_int_t{1'000'000'000'000'000'000}};
  schema::big_int_t elevated_token_buyer_purchase{100'000'000'000};

  // Worker threads for batch decoding; 1 decodes inline.
  std::size_t parallelism{1};
  std::size_t cache_capacity{64};

  std::vector<decimals_convention> extra_conventions;
};

/// Command line surface of the `docket` executable.
struct app_config final {
  std::string command;
  std::string argument;
  std::string batch_path;
  std::string schemas_path;
  std::string config_path;
  std::string log_level{"info"};
  std::string log_file;
  bool help{false};
  decoder_config decoder;
};

boost::program_options::options_description make_options_description();

/// Parse the command line, then the INI file named by `--config` if any.
/// Command line values take precedence. Throws
/// boost::program_options::error on malformed input.
app_config load_config(int argc, const char* const argv[]);

}  // namespace docket::config
