#pragma once
#include <tender/schema/primitives.hpp>

#include <cstdint>

// Schema type: offer.
// Standing sell order. Written once at creation and never mutated;
// `total_size` is not drawn down by settlements.
namespace tender::schema {

template <uint16_t Version>
struct offer;

template <>
struct offer<1> final {
  uint16_t version{1};
  uint64_t id{};
  address_t seller{};
  address_t offer_token{};
  address_t bid_token{};
  // Price of one whole offer token in bid token base units.
  amount_t min_price{};
  amount_t min_bid_size{};
  amount_t total_size{};
  uint8_t offer_token_decimals{};
};

using offer_t = offer<1>;

/// Read-only projection returned by offer lookups.
struct offer_details_t final {
  address_t seller{};
  address_t offer_token{};
  address_t bid_token{};
  amount_t min_price{};
  amount_t min_bid_size{};
};

}  // namespace tender::schema
