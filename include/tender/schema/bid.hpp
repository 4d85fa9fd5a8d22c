#pragma once
#include <tender/schema/primitives.hpp>

#include <cstdint>

// Schema type: bid.
// Off-chain authorization to fill part of an offer. Never stored; lives for
// the duration of a check or settlement call.
namespace tender::schema {

template <uint16_t Version>
struct bid;

template <>
struct bid<1> final {
  uint16_t version{1};
  uint64_t offer_id{};
  // Caller supplied correlation id, not checked for uniqueness.
  uint64_t bid_id{};
  address_t signer_address{};
  address_t bidder_address{};
  address_t bid_token{};
  address_t offer_token{};
  amount_t bid_amount{};
  amount_t sell_amount{};
  signature_t signature{};
};

using bid_t = bid<1>;

}  // namespace tender::schema
