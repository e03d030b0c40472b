#pragma once

#include <docket/registry/builtin_contracts.hpp>
#include <docket/schema/call_descriptor.hpp>
#include <docket/testing/common.hpp>

#include <string>
#include <vector>

namespace docket::testing {

/// 365 day USDC stream of $9,000 to kAlice, predicted at kPredictedStream.
inline docket::schema::call_descriptor make_stream_creation() {
  return docket::schema::call_descriptor{
      .target = std::string{docket::registry::kStreamFactoryAddress},
      .value = "0",
      .signature = "createStream(address,uint256,address,uint256,uint256,"
                   "uint8,address)",
      .calldata = calldata(
          "410aa522",
          {address_word(kAlice), word(9'000'000'000),
           address_word(docket::registry::kUsdcAddress), word(1'700'000'000),
           word(1'731'536'000), word(0), address_word(kPredictedStream)}),
  };
}

inline docket::schema::call_descriptor make_usdc_transfer(
    const std::string_view to,
    const uint64_t amount) {
  return docket::schema::call_descriptor{
      .target = std::string{docket::registry::kUsdcAddress},
      .value = "0",
      .signature = "transfer(address,uint256)",
      .calldata =
          calldata("a9059cbb", {address_word(to), word(amount)}),
  };
}

/// Stream creation followed by the USDC transfer funding it.
inline std::vector<docket::schema::call_descriptor> make_stream_proposal() {
  return {make_stream_creation(),
          make_usdc_transfer(kPredictedStream, 9'000'000'000)};
}

}  // namespace docket::testing
