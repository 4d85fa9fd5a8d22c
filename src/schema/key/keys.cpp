#include <tender/schema/key/builder.hpp>
#include <tender/schema/key/keys.hpp>

using namespace tender::schema;

namespace tender::schema::key {

bytes_t make_offer_key(const uint64_t offer_id) {
  auto b = builder{};
  b.write(kOfferPrefix);
  b.write(offer_id);
  return b.data;
}

bytes_t make_next_offer_id_key() {
  return make_bytes(kNextOfferIdKey);
}

bytes_t make_nonce_key(const address_t& signer) {
  auto b = builder{};
  b.write(kNoncePrefix);
  b.write(signer);
  return b.data;
}

bytes_t make_delegation_key(const address_t& bidder) {
  auto b = builder{};
  b.write(kDelegationPrefix);
  b.write(bidder);
  return b.data;
}

bytes_t make_event_key(const uint64_t sequence) {
  auto b = builder{};
  b.write(kEventPrefix);
  b.write(sequence);
  return b.data;
}

bytes_t make_event_head_key() {
  return make_bytes(kEventHeadKey);
}

}  // namespace tender::schema::key
