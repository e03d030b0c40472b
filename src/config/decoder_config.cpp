#include <docket/config/decoder_config.hpp>
#include <docket/format/number.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <fstream>
#include <utility>

namespace docket::config {

namespace po = boost::program_options;

namespace {

constexpr auto kWeiPerEth = uint64_t{1'000'000'000'000'000'000};
constexpr auto kUsdcUnit = uint64_t{1'000'000};

std::optional<uint8_t> parse_decimals(const std::string_view text) {
  auto value = unsigned{};
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end || value > 77) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(value);
}

}  // namespace

std::optional<decimals_convention> try_parse_convention(
    const std::string_view text) {
  auto colon = text.find(':');
  auto equals = text.find('=');
  if (colon == std::string_view::npos || equals == std::string_view::npos ||
      equals < colon) {
    return std::nullopt;
  }
  auto symbol_colon = text.find(':', equals);
  auto decimals_end =
      symbol_colon == std::string_view::npos ? text.size() : symbol_colon;

  auto function = text.substr(0, colon);
  auto parameter = text.substr(colon + 1, equals - colon - 1);
  auto decimals =
      parse_decimals(text.substr(equals + 1, decimals_end - equals - 1));
  if (function.empty() || parameter.empty() || !decimals) {
    return std::nullopt;
  }
  auto symbol = symbol_colon == std::string_view::npos
                    ? std::string_view{"tokens"}
                    : text.substr(symbol_colon + 1);
  if (symbol.empty()) {
    return std::nullopt;
  }
  return decimals_convention{.function = std::string{function},
                             .parameter = std::string{parameter},
                             .decimals = *decimals,
                             .symbol = std::string{symbol}};
}

po::options_description make_options_description() {
  auto description = po::options_description{"docket options"};
  description.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(), "decode|selector|fingerprint")(
      "argument", po::value<std::string>(),
      "signature for the selector command")(
      "batch,b", po::value<std::string>(),
      "tab separated descriptor file (target, value, signature, calldata)")(
      "schemas,s", po::value<std::string>(), "schema bundle file")(
      "config,c", po::value<std::string>(), "INI configuration file")(
      "log-level", po::value<std::string>()->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>()->default_value(""),
      "also log to this file")(
      "no-token-heuristic", po::bool_switch(),
      "disable the generic token amount heuristic")(
      "token-threshold",
      po::value<std::string>()->default_value("1000000000000000"),
      "raw amount above which unknown amounts are shown as tokens")(
      "token-decimals", po::value<unsigned>()->default_value(18),
      "decimals assumed by the generic token heuristic")(
      "elevated-usdc-payment", po::value<uint64_t>()->default_value(50'000),
      "USDC payments above this many dollars are elevated")(
      "elevated-eth-transfer", po::value<uint64_t>()->default_value(10),
      "ETH transfers above this many ETH are elevated")(
      "elevated-token-buyer", po::value<uint64_t>()->default_value(100'000),
      "token buyer purchases above this many dollars are elevated")(
      "parallelism,j", po::value<std::size_t>()->default_value(1),
      "decode worker threads")(
      "cache-capacity", po::value<std::size_t>()->default_value(64),
      "decoded batches kept in memory")(
      "convention", po::value<std::vector<std::string>>()->composing(),
      "extra amount convention function:parameter=decimals:symbol");
  return description;
}

app_config load_config(const int argc, const char* const argv[]) {
  auto description = make_options_description();
  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  positional.add("argument", 1);

  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(description)
                .positional(positional)
                .run(),
            vm);
  if (vm.contains("config")) {
    auto path = vm["config"].as<std::string>();
    auto input = std::ifstream{path};
    if (!input) {
      throw po::error{"unable to open config file '" + path + "'"};
    }
    po::store(po::parse_config_file(input, description), vm);
  }
  po::notify(vm);

  auto config = app_config{};
  config.help = vm.contains("help");
  if (vm.contains("command")) {
    config.command = vm["command"].as<std::string>();
  }
  if (vm.contains("argument")) {
    config.argument = vm["argument"].as<std::string>();
  }
  if (vm.contains("batch")) {
    config.batch_path = vm["batch"].as<std::string>();
  }
  if (vm.contains("schemas")) {
    config.schemas_path = vm["schemas"].as<std::string>();
  }
  if (vm.contains("config")) {
    config.config_path = vm["config"].as<std::string>();
  }
  config.log_level = vm["log-level"].as<std::string>();
  config.log_file = vm["log-file"].as<std::string>();

  auto& decoder = config.decoder;
  decoder.generic_token_heuristic = !vm["no-token-heuristic"].as<bool>();
  auto threshold =
      format::try_parse_uint(vm["token-threshold"].as<std::string>());
  if (!threshold) {
    throw po::invalid_option_value{vm["token-threshold"].as<std::string>()};
  }
  decoder.generic_token_threshold = std::move(*threshold);
  auto token_decimals = vm["token-decimals"].as<unsigned>();
  if (token_decimals > 77) {
    throw po::invalid_option_value{std::to_string(token_decimals)};
  }
  decoder.generic_token_decimals = static_cast<uint8_t>(token_decimals);
  decoder.elevated_usdc_payment =
      schema::big_int_t{vm["elevated-usdc-payment"].as<uint64_t>()} * kUsdcUnit;
  decoder.elevated_eth_transfer =
      schema::big_int_t{vm["elevated-eth-transfer"].as<uint64_t>()} *
      kWeiPerEth;
  decoder.elevated_token_buyer_purchase =
      schema::big_int_t{vm["elevated-token-buyer"].as<uint64_t>()} * kUsdcUnit;
  decoder.parallelism =
      std::max<std::size_t>(1, vm["parallelism"].as<std::size_t>());
  decoder.cache_capacity = vm["cache-capacity"].as<std::size_t>();

  if (vm.contains("convention")) {
    for (const auto& text : vm["convention"].as<std::vector<std::string>>()) {
      auto convention = try_parse_convention(text);
      if (!convention) {
        throw po::invalid_option_value{text};
      }
      decoder.extra_conventions.push_back(std::move(*convention));
    }
  }
  spdlog::debug("Loaded configuration: command='{}' parallelism={}",
                config.command, decoder.parallelism);
  return config;
}

}  // namespace docket::config
