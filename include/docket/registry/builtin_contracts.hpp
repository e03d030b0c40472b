#pragma once
#include <docket/schema/contract_schema_entry.hpp>

#include <string_view>
#include <vector>

namespace docket::registry {

inline constexpr auto kUsdcAddress =
    std::string_view{"0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48"};
inline constexpr auto kWethAddress =
    std::string_view{"0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2"};
inline constexpr auto kStreamFactoryAddress =
    std::string_view{"0x0fd206fc7a7dbcd5661157edcb1ffdd0d02a61ff"};
inline constexpr auto kPayerAddress =
    std::string_view{"0xd97bcd9f47cee35c0a9ec1dc40c1269afc9e8e1d"};
inline constexpr auto kTreasuryAddress =
    std::string_view{"0xb1a32fc9f9d8b2cf86c068cae13108809547ef71"};
inline constexpr auto kTokenBuyerAddress =
    std::string_view{"0x4f2acdc74f6941390d9b1804fabc3e780388cfe5"};

std::vector<schema::contract_schema_entry> builtin_contracts();

}  // namespace docket::registry
