#pragma once
#include <tender/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

// Storage keyspace. Every persisted row lives under one of these prefixes.
namespace tender::schema::key {

inline constexpr auto kOfferPrefix = std::string_view{"OFFER|"};
inline constexpr auto kNextOfferIdKey = std::string_view{"SYS|OFFER|NEXT_ID"};
inline constexpr auto kNoncePrefix = std::string_view{"NONCE|"};
inline constexpr auto kDelegationPrefix = std::string_view{"DELEGATE|"};
inline constexpr auto kEventPrefix = std::string_view{"EVENT|"};
inline constexpr auto kEventHeadKey = std::string_view{"SYS|EVENT|HEAD"};

bytes_t make_offer_key(uint64_t offer_id);
bytes_t make_next_offer_id_key();
bytes_t make_nonce_key(const address_t& signer);
bytes_t make_delegation_key(const address_t& bidder);
bytes_t make_event_key(uint64_t sequence);
bytes_t make_event_head_key();

}  // namespace tender::schema::key
