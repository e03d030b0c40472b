#pragma once
#include <docket/schema/abi_type.hpp>
#include <docket/schema/decoded_value.hpp>
#include <docket/schema/primitives.hpp>

#include <stdexcept>
#include <vector>

namespace docket::abi {

/// Structural corruption in ABI encoded data: an offset or length pointing
/// outside the payload, a truncated word, an array too long for the data, or
/// values decoding to far more bytes than the payload holds.
class decode_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

std::vector<schema::decoded_value> decode(
    const std::vector<schema::abi_type>& types,
    const schema::bytes_view_t& data);

schema::big_int_t to_unsigned(const schema::bytes_view_t& word,
                              uint16_t bits = 256);

schema::big_int_t to_signed(const schema::bytes_view_t& word,
                            uint16_t bits = 256);

schema::address_t to_address(const schema::bytes_view_t& word);

}  // namespace docket::abi
