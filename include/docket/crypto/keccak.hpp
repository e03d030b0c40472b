#pragma once

#include <docket/schema/primitives.hpp>

#include <optional>
#include <string_view>

namespace docket::crypto {

bool keccak_available();

std::optional<docket::schema::hash32_t> keccak256(
    const docket::schema::bytes_view_t& bytes);

std::optional<docket::schema::selector_t> selector(std::string_view signature);

}  // namespace docket::crypto
