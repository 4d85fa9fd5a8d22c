#include <gtest/gtest.h>
#include <tender/schema/encoding/scale/encoder.hpp>
#include <tender/schema/event.hpp>
#include <tender/schema/offer.hpp>
#include <tender/testing/common.hpp>

#include <limits>

using namespace tender::schema;

namespace {

using encoder_t = tender::schema::encoding::scale_encoder_t;

}  // namespace

TEST(encoding, offer_survives_encode_decode) {
  auto encoder = encoder_t{};
  auto offer = offer_t{};
  offer.id = 7;
  offer.seller = tender::testing::make_address(1);
  offer.offer_token = tender::testing::make_address(2);
  offer.bid_token = tender::testing::make_address(3);
  offer.min_price = std::numeric_limits<amount_t>::max();
  offer.min_bid_size = 1;
  offer.total_size = tender::testing::make_amount("100000000000000000000");
  offer.offer_token_decimals = 18;

  auto bytes = encoder.encode(offer);
  auto decoded = encoder.decode<offer_t>(bytes_view_t{bytes.data(), bytes.size()});
  EXPECT_EQ(decoded.version, 1u);
  EXPECT_EQ(decoded.id, offer.id);
  EXPECT_EQ(decoded.seller, offer.seller);
  EXPECT_EQ(decoded.offer_token, offer.offer_token);
  EXPECT_EQ(decoded.bid_token, offer.bid_token);
  EXPECT_EQ(decoded.min_price, offer.min_price);
  EXPECT_EQ(decoded.min_bid_size, offer.min_bid_size);
  EXPECT_EQ(decoded.total_size, offer.total_size);
  EXPECT_EQ(decoded.offer_token_decimals, 18u);
}

TEST(encoding, event_survives_encode_decode) {
  auto encoder = encoder_t{};
  auto event = event_t{};
  event.type = std::string{kSettlementCompletedEvent};
  event.attributes = {
      event_attribute_t{.key = "offer_id", .value = "1", .index = true},
      event_attribute_t{.key = "nonce", .value = "0"}};

  auto bytes = encoder.encode(event);
  auto decoded =
      encoder.try_decode<event_t>(bytes_view_t{bytes.data(), bytes.size()});
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->type, event.type);
  ASSERT_EQ(decoded->attributes.size(), 2u);
  EXPECT_TRUE(decoded->attributes[0].index);
  EXPECT_FALSE(decoded->attributes[1].index);
  EXPECT_EQ(decoded->attribute("nonce"), std::optional<std::string>{"0"});
  EXPECT_FALSE(decoded->attribute("missing").has_value());
}

TEST(encoding, truncated_offer_does_not_decode) {
  auto encoder = encoder_t{};
  auto bytes = encoder.encode(offer_t{});
  bytes.resize(bytes.size() / 2);
  EXPECT_FALSE(encoder.try_decode<offer_t>(bytes_view_t{bytes.data(), bytes.size()})
                   .has_value());
}
