#pragma once
#include <docket/config/decoder_config.hpp>
#include <docket/schema/decoded_parameter.hpp>
#include <docket/schema/primitives.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace docket::format {

struct token_convention final {
  uint8_t decimals{18};
  std::string symbol;
  // Rendered as `$X.XX` instead of `<amount> <symbol>`.
  bool usd{false};

  bool operator==(const token_convention&) const = default;
};

/// Pluggable table deciding how raw integer amounts are scaled for display.
///
/// Resolution order for one amount parameter:
/// 1. an explicit `(function, parameter)` convention;
/// 2. the convention of the called token contract, for ERC-20 amount
///    parameters;
/// 3. the convention of a token named by another parameter of the same call
///    (`createStream.tokenAddress` scales `tokenAmount`).
/// The generic threshold heuristic is a separate, best-effort fallback that
/// only the manual decoder consults.
class decimals_strategy final {
 public:
  decimals_strategy() = default;

  /// Built-in conventions: Payer and Token Buyer amounts in USDC, USDC and
  /// WETH token contracts, stream factory and treasury token parameters.
  static decimals_strategy defaults();

  /// `defaults()` plus the configured extras and heuristic settings.
  static decimals_strategy from_config(const config::decoder_config& config);

  void add_parameter_convention(std::string function,
                                std::string parameter,
                                token_convention convention);
  void add_token_convention(std::string_view address,
                            token_convention convention);
  void add_token_parameter(std::string function,
                           std::string amount_parameter,
                           std::string token_parameter);

  std::optional<token_convention> resolve(
      std::string_view target,
      std::string_view function,
      std::string_view parameter,
      const std::vector<schema::decoded_parameter>& parameters) const;

  std::optional<token_convention> for_token(std::string_view address) const;

  void set_generic_heuristic(bool enabled,
                             schema::big_int_t threshold,
                             uint8_t decimals);

  /// `<raw> (<amount> tokens)` when the heuristic is enabled and the value is
  /// above its threshold.
  std::optional<std::string> apply_generic_heuristic(
      const schema::big_int_t& value) const;

 private:
  using key_t = std::pair<std::string, std::string>;

  std::map<key_t, token_convention> parameters_;
  std::map<std::string, token_convention> tokens_;
  std::map<key_t, std::string> token_parameters_;
  bool generic_enabled_{true};
  schema::big_int_t generic_threshold_{1'000'000'000'000'000};
  uint8_t generic_decimals_{18};
};

/// Rewrite the display value of every integer parameter a convention covers.
/// The generic heuristic is consulted only when `allow_generic` is set.
void apply_amount_conventions(
    const decimals_strategy& strategy,
    std::string_view target,
    std::string_view function,
    std::vector<schema::decoded_parameter>& parameters,
    bool allow_generic);

/// `9,000,000,000 ($9,000.00)` or `1,500,000,000,000,000,000 (1.5 WETH)`.
std::string format_amount(const schema::big_int_t& value,
                          const token_convention& convention);

/// `$9,000.00` or `1.5 WETH`, without the raw value.
std::string format_token_amount(const schema::big_int_t& value,
                                const token_convention& convention);

}  // namespace docket::format
