#include <docket/classify/recipient_classifier.hpp>
#include <docket/schema/primitives.hpp>

#include <algorithm>
#include <array>
#include <utility>

namespace docket::classify {

namespace {

// Position of the recipient argument in well-known function shapes.
constexpr auto kRecipientPositions =
    std::array<std::pair<std::string_view, std::size_t>, 17>{{
        {"transfer", 0},
        {"transferFrom", 1},
        {"send", 0},
        {"safeTransfer", 1},
        {"safeTransferFrom", 1},
        {"sendOrRegisterDebt", 0},
        {"pay", 0},
        {"sendPayment", 0},
        {"approve", 0},
        {"setApprovalForAll", 0},
        {"delegate", 0},
        {"delegateBySig", 0},
        {"mint", 0},
        {"mintTo", 0},
        {"safeMint", 0},
        {"transferOwnership", 0},
        {"grantRole", 1},
    }};

constexpr auto kRecipientNames = std::array<std::string_view, 11>{
    "recipient", "to",    "account",  "spender", "delegatee",  "receiver",
    "beneficiary", "owner", "newowner", "target", "destination"};

constexpr auto kPaymentFunctions = std::array<std::string_view, 8>{
    "transfer", "transferFrom", "send", "sendOrRegisterDebt",
    "pay",      "sendPayment",  "safeTransfer", "safeTransferFrom"};

constexpr auto kDelegationFunctions =
    std::array<std::string_view, 2>{"delegate", "delegateBySig"};

// Role labels keyed on a fragment of the lowercase parameter name.
constexpr auto kNamedRoles =
    std::array<std::pair<std::string_view, std::string_view>, 4>{{
        {"spender", "Approved Spender"},
        {"delegatee", "Voting Delegate"},
        {"owner", "New Owner"},
        {"beneficiary", "Beneficiary"},
    }};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& table,
              const std::string_view value) {
  return std::ranges::find(table, value) != std::end(table);
}

}  // namespace

bool is_payment_function(const std::string_view function_name) {
  return contains(kPaymentFunctions, function_name);
}

bool is_delegation_function(const std::string_view function_name) {
  return contains(kDelegationFunctions, function_name);
}

bool is_recipient(const std::string_view function_name,
                  const std::string_view parameter_name,
                  const std::string_view base_type,
                  const std::size_t index) {
  if (base_type != "address") {
    return false;
  }
  for (const auto& [function, position] : kRecipientPositions) {
    if (function == function_name && position == index) {
      return true;
    }
  }
  return contains(kRecipientNames, schema::to_lower(parameter_name));
}

std::string recipient_role(const std::string_view function_name,
                           const std::string_view parameter_name) {
  auto lower = schema::to_lower(parameter_name);
  for (const auto& [fragment, role] : kNamedRoles) {
    if (lower.find(fragment) != std::string::npos) {
      return std::string{role};
    }
  }
  if (is_payment_function(function_name)) {
    return "Recipient";
  }
  if (is_delegation_function(function_name)) {
    return "Delegate";
  }
  if (function_name.find("mint") != std::string_view::npos) {
    return "Recipient";
  }
  if (function_name.find("burn") != std::string_view::npos) {
    return "From";
  }
  return "Address";
}

}  // namespace docket::classify
