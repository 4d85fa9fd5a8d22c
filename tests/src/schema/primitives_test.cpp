#include <gtest/gtest.h>
#include <tender/schema/bid_violation.hpp>
#include <tender/schema/error_code.hpp>
#include <tender/schema/key/keys.hpp>
#include <tender/schema/primitives.hpp>

#include <limits>

using namespace tender::schema;

TEST(primitives, hex_round_trip_accepts_prefix_and_case) {
  auto bytes = try_from_hex("0xDEadBeef");
  ASSERT_TRUE(bytes.has_value());
  EXPECT_EQ(*bytes, (bytes_t{0xDE, 0xAD, 0xBE, 0xEF}));
  EXPECT_EQ(to_hex(*bytes), "deadbeef");
  EXPECT_FALSE(try_from_hex("abc").has_value());
  EXPECT_FALSE(try_from_hex("zz").has_value());
  EXPECT_TRUE(try_from_hex("").has_value());
}

TEST(primitives, fixed_width_parsers_check_length) {
  EXPECT_TRUE(
      try_make_address("0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf").has_value());
  EXPECT_FALSE(
      try_make_address("0x7E5F4552091A69125d5DfCb7b8C2659029395B").has_value());
  EXPECT_FALSE(try_make_hash32("0x00").has_value());
  EXPECT_FALSE(try_make_signature(std::string(128, '0')).has_value());
  EXPECT_TRUE(try_make_signature(std::string(130, '0')).has_value());
}

TEST(primitives, address_rendering) {
  auto address =
      try_make_address("0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf").value();
  EXPECT_EQ(to_string(address), "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
  EXPECT_TRUE(is_zero(make_zero_address()));
  EXPECT_FALSE(is_zero(address));
}

TEST(primitives, amounts_parse_decimal_and_hex) {
  EXPECT_EQ(try_make_amount("10000000000000000000"),
            amount_t{10000000000000000000ull});
  EXPECT_EQ(try_make_amount("0xff"), amount_t{255});
  EXPECT_FALSE(try_make_amount("").has_value());
  EXPECT_FALSE(try_make_amount("0x").has_value());
  EXPECT_FALSE(try_make_amount("12a").has_value());
  EXPECT_FALSE(try_make_amount("-1").has_value());

  auto max = std::numeric_limits<amount_t>::max();
  EXPECT_EQ(try_make_amount(max.str()), max);
  EXPECT_FALSE(
      try_make_amount("0x1" + std::string(64, '0')).has_value());
}

TEST(primitives, words_are_big_endian) {
  auto word = to_word(amount_t{0x0102});
  EXPECT_EQ(word[30], 0x01);
  EXPECT_EQ(word[31], 0x02);
  EXPECT_EQ(from_word(word), amount_t{0x0102});
  EXPECT_EQ(to_word(uint64_t{0x0102}), word);

  auto max = std::numeric_limits<amount_t>::max();
  EXPECT_EQ(from_word(to_word(max)), max);
}

TEST(primitives, error_codes_have_names) {
  EXPECT_EQ(to_string(error_code::invalid_signature), "invalid_signature");
  EXPECT_EQ(static_cast<uint32_t>(error_code::transfer_failed), 7u);
  EXPECT_EQ(try_from_string<error_code>("not_found"), error_code::not_found);
  EXPECT_FALSE(try_from_string<error_code>("nope").has_value());
}

TEST(primitives, bid_violations_have_wire_names) {
  EXPECT_EQ(to_string(bid_violation::signature_mismatched),
            "SIGNATURE_MISMATCHED");
  EXPECT_EQ(to_string(bid_violation::seller_allowance_low),
            "SELLER_ALLOWANCE_LOW");
  EXPECT_EQ(try_from_string<bid_violation>("PRICE_TOO_LOW"),
            bid_violation::price_too_low);
}

TEST(primitives, integer_key_suffixes_sort_numerically) {
  auto first = key::make_offer_key(2);
  auto second = key::make_offer_key(256);
  EXPECT_LT(first, second);
  EXPECT_EQ(first.size(), key::kOfferPrefix.size() + sizeof(uint64_t));
  EXPECT_EQ(first.back(), 2u);
}
