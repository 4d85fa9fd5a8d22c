#pragma once
#include <tender/crypto/domain.hpp>
#include <tender/schema/bid.hpp>
#include <tender/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

namespace tender::crypto {

inline constexpr auto kDomainType = std::string_view{
    "EIP712Domain(string name,string version,uint256 chainId,"
    "address verifyingContract)"};

// Field order is the interoperability contract with external signers.
inline constexpr auto kBidType = std::string_view{
    "Bid(uint256 offerId,uint256 bidId,address signerAddress,"
    "address bidderAddress,address bidToken,address offerToken,"
    "uint256 bidAmount,uint256 sellAmount,uint256 nonce)"};

inline constexpr auto kTestPayloadType =
    std::string_view{"Test(uint256 value,address account,uint256 nonce)"};

/// Minimal payload used to exercise the typed-data pipeline end to end
/// without an offer.
struct test_payload_t final {
  tender::schema::amount_t value{};
  tender::schema::address_t account{};
};

/// Head-only ABI encoder: every value occupies one 32-byte word.
struct abi_encoder final {
  tender::schema::bytes_t data;

  abi_encoder& word(const tender::schema::word_t& value);
  abi_encoder& uint256(const tender::schema::amount_t& value);
  abi_encoder& uint256(uint64_t value);
  abi_encoder& address(const tender::schema::address_t& value);
};

tender::schema::hash32_t type_hash(const std::string_view& type);

/// keccak256("\x19\x01" || domain_separator || struct_hash)
tender::schema::hash32_t typed_data_digest(
    const tender::schema::hash32_t& domain_separator,
    const tender::schema::hash32_t& struct_hash);

tender::schema::hash32_t bid_struct_hash(const tender::schema::bid_t& bid,
                                         uint64_t nonce);

/// Digest a signer commits to for `bid` at `nonce`. Read paths pass the
/// signer's current nonce, settlement passes the nonce it just consumed.
tender::schema::hash32_t digest_for_bid(const domain_context& domain,
                                        const tender::schema::bid_t& bid,
                                        uint64_t nonce);

tender::schema::hash32_t digest_for_test_payload(
    const domain_context& domain,
    const test_payload_t& payload,
    uint64_t nonce);

}  // namespace tender::crypto
