#include <tender/schema/encoding/scale/offer.hpp>

using namespace tender::schema;

namespace tender::schema::encoding::scale {

void encode(offer<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.seller, encoder);
  encode(o.offer_token, encoder);
  encode(o.bid_token, encoder);
  encode(to_word(o.min_price), encoder);
  encode(to_word(o.min_bid_size), encoder);
  encode(to_word(o.total_size), encoder);
  encode(o.offer_token_decimals, encoder);
}

void decode(offer<1>&& o, ::scale::Decoder& decoder) {
  auto min_price = word_t{};
  auto min_bid_size = word_t{};
  auto total_size = word_t{};
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.seller, decoder);
  decode(o.offer_token, decoder);
  decode(o.bid_token, decoder);
  decode(min_price, decoder);
  decode(min_bid_size, decoder);
  decode(total_size, decoder);
  decode(o.offer_token_decimals, decoder);
  o.min_price = from_word(min_price);
  o.min_bid_size = from_word(min_bid_size);
  o.total_size = from_word(total_size);
}

}  // namespace tender::schema::encoding::scale
