#include <tender/crypto/keccak.hpp>
#include <tender/crypto/typed_data.hpp>

#include <algorithm>
#include <array>
#include <iterator>

namespace tender::crypto {

abi_encoder& abi_encoder::word(const tender::schema::word_t& value) {
  data.insert(std::end(data), std::begin(value), std::end(value));
  return *this;
}

abi_encoder& abi_encoder::uint256(
    const tender::schema::amount_t& value) {
  return word(tender::schema::to_word(value));
}

abi_encoder& abi_encoder::uint256(const uint64_t value) {
  return word(tender::schema::to_word(value));
}

abi_encoder& abi_encoder::address(const tender::schema::address_t& value) {
  auto padded = tender::schema::word_t{};
  std::copy(std::begin(value), std::end(value),
            std::end(padded) - static_cast<std::ptrdiff_t>(value.size()));
  return word(padded);
}

tender::schema::hash32_t type_hash(const std::string_view& type) {
  return keccak256(type);
}

tender::schema::hash32_t typed_data_digest(
    const tender::schema::hash32_t& domain_separator,
    const tender::schema::hash32_t& struct_hash) {
  static constexpr auto kPrefix = std::array<uint8_t, 2>{0x19, 0x01};
  return keccak256_hasher{}
      .update(kPrefix)
      .update(domain_separator)
      .update(struct_hash)
      .finalize();
}

tender::schema::hash32_t bid_struct_hash(const tender::schema::bid_t& bid,
                                         const uint64_t nonce) {
  static const auto kBidTypeHash = type_hash(kBidType);
  auto encoded = abi_encoder{};
  encoded.word(kBidTypeHash)
      .uint256(bid.offer_id)
      .uint256(bid.bid_id)
      .address(bid.signer_address)
      .address(bid.bidder_address)
      .address(bid.bid_token)
      .address(bid.offer_token)
      .uint256(bid.bid_amount)
      .uint256(bid.sell_amount)
      .uint256(nonce);
  return keccak256(encoded.data);
}

tender::schema::hash32_t digest_for_bid(const domain_context& domain,
                                        const tender::schema::bid_t& bid,
                                        const uint64_t nonce) {
  return typed_data_digest(domain.separator(), bid_struct_hash(bid, nonce));
}

tender::schema::hash32_t digest_for_test_payload(
    const domain_context& domain,
    const test_payload_t& payload,
    const uint64_t nonce) {
  static const auto kTestPayloadTypeHash = type_hash(kTestPayloadType);
  auto encoded = abi_encoder{};
  encoded.word(kTestPayloadTypeHash)
      .uint256(payload.value)
      .address(payload.account)
      .uint256(nonce);
  return typed_data_digest(domain.separator(), keccak256(encoded.data));
}

}  // namespace tender::crypto
