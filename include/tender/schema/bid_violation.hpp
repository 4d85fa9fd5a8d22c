#pragma once

#include <tender/schema/enum_string.hpp>

#include <cstdint>

// Schema type: bid violation.
// Reason a candidate bid fails one rule of the pre-flight check. Declared in
// the order the checks run.
namespace tender::schema {

enum class bid_violation : uint8_t {
  signature_mismatched = 0,
  invalid_signer_for_bidder = 1,
  bid_too_small = 2,
  bid_exceed_total_size = 3,
  price_too_low = 4,
  bidder_allowance_low = 5,
  seller_allowance_low = 6,
};

inline constexpr auto kBidViolationNames = enum_names<bid_violation, 7>{
    {"SIGNATURE_MISMATCHED", "INVALID_SIGNER_FOR_BIDDER", "BID_TOO_SMALL",
     "BID_EXCEED_TOTAL_SIZE", "PRICE_TOO_LOW", "BIDDER_ALLOWANCE_LOW",
     "SELLER_ALLOWANCE_LOW"}};

template <>
inline std::optional<bid_violation> try_from_string<bid_violation>(
    const std::string_view value) {
  return kBidViolationNames.parse(value);
}

inline constexpr std::string_view to_string(const bid_violation value) {
  return kBidViolationNames.name_of(value).value_or("UNKNOWN");
}

}  // namespace tender::schema
