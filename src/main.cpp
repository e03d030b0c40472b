#include <docket/abi/type_parser.hpp>
#include <docket/batch/batch.hpp>
#include <docket/batch/batch_cache.hpp>
#include <docket/common/critical.hpp>
#include <docket/config/decoder_config.hpp>
#include <docket/crypto/keccak.hpp>
#include <docket/decoder/action_decoder.hpp>
#include <docket/registry/schema_bundle.hpp>
#include <docket/registry/schema_registry.hpp>
#include <fmt/format.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

void install_logger(const docket::config::app_config& config) {
  auto level = spdlog::level::from_str(config.log_level);
  if (level == spdlog::level::off && config.log_level != "off") {
    docket::common::critical(
        fmt::format("Unknown log level '{}'", config.log_level));
  }

  spdlog::init_thread_pool(8192, 1);
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (!config.log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        config.log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "docket", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(level);
}

docket::batch::batch_t read_batch_file(const std::string& path) {
  if (path.empty()) {
    docket::common::critical("--batch is required");
  }
  auto input = std::ifstream{path};
  if (!input) {
    docket::common::critical(
        fmt::format("Unable to open batch file '{}'", path));
  }
  auto batch = docket::batch::read_batch(input);
  spdlog::info("Read {} descriptor(s) from {}", batch.size(), path);
  return batch;
}

void print_action(const std::size_t index,
                  const docket::schema::decoded_action& action) {
  fmt::print("#{} {} ({}) [{}, {}]\n", index + 1, action.contract_name,
             action.target, docket::schema::to_string(action.category),
             docket::schema::to_string(action.severity));
  fmt::print("    function: {}\n", action.signature.empty()
                                         ? std::string{"(none)"}
                                         : action.signature);
  fmt::print("    value: {}\n", action.value_formatted);
  for (const auto& parameter : action.parameters) {
    fmt::print("    {} ({}): {}", parameter.name, parameter.declared_type,
               parameter.display_value);
    if (parameter.recipient_role) {
      fmt::print(" [{}]", *parameter.recipient_role);
    }
    fmt::print("\n");
  }
  fmt::print("    {}\n", action.function_description);
  fmt::print("    summary: {}\n", action.summary);
}

int run_decode(const docket::config::app_config& config) {
  auto registry = docket::registry::schema_registry{};
  if (!config.schemas_path.empty()) {
    auto loaded =
        docket::registry::load_bundle_file(registry, config.schemas_path);
    if (!loaded) {
      docket::common::critical(fmt::format("Unable to open schema bundle '{}'",
                                           config.schemas_path));
    }
    spdlog::info("Registered {} contract(s) from {}", *loaded,
                 config.schemas_path);
  }

  auto batch = read_batch_file(config.batch_path);
  auto decoder = docket::decoder::action_decoder{registry, config.decoder};
  auto cache = docket::batch::batch_cache{config.decoder.cache_capacity};
  auto actions = cache.decode(decoder, batch);

  for (std::size_t i = 0; i < actions->size(); ++i) {
    print_action(i, (*actions)[i]);
  }
  fmt::print("Recipients:\n");
  for (const auto& address : docket::batch::extract_recipients(*actions)) {
    fmt::print("    {}\n", address);
  }
  fmt::print("Summary: {}\n", docket::batch::summarize(*actions));
  return 0;
}

int run_selector(const docket::config::app_config& config) {
  if (config.argument.empty()) {
    docket::common::critical("selector requires a function signature");
  }
  if (!docket::crypto::keccak_available()) {
    docket::common::critical(
        "The linked OpenSSL does not provide KECCAK-256");
  }
  auto signature = config.argument;
  if (auto parsed = docket::abi::parse_function(config.argument); parsed) {
    signature = parsed->signature;
  }
  auto selector = docket::crypto::selector(signature);
  if (!selector) {
    docket::common::critical(
        fmt::format("Unable to hash signature '{}'", signature));
  }
  fmt::print("{} {}\n", docket::schema::to_string(*selector), signature);
  return 0;
}

int run_fingerprint(const docket::config::app_config& config) {
  auto batch = read_batch_file(config.batch_path);
  fmt::print("{}\n", docket::schema::to_hex(docket::batch::fingerprint(batch)));
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto config = docket::config::app_config{};
  try {
    config = docket::config::load_config(argc, argv);
  } catch (const boost::program_options::error& e) {
    std::cerr << docket::config::make_options_description() << std::endl;
    docket::common::critical(fmt::format("Invalid arguments: {}", e.what()));
  }

  if (config.help || config.command.empty()) {
    std::cout << "Usage: docket <decode|selector|fingerprint> [options]\n"
              << docket::config::make_options_description() << std::endl;
    return config.help ? 0 : 1;
  }

  install_logger(config);

  auto result = 0;
  if (config.command == "decode") {
    result = run_decode(config);
  } else if (config.command == "selector") {
    result = run_selector(config);
  } else if (config.command == "fingerprint") {
    result = run_fingerprint(config);
  } else {
    docket::common::critical(
        fmt::format("Unknown command '{}'", config.command));
  }

  spdlog::shutdown();
  return result;
}
