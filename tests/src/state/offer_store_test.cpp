#include <gtest/gtest.h>
#include <tender/state/event_journal.hpp>
#include <tender/state/offer_store.hpp>
#include <tender/testing/common.hpp>

namespace {

using encoder_t = tender::schema::encoding::scale_encoder_t;
using memory_t = tender::storage::memory_storage_t;
using rocksdb_t = tender::storage::rocksdb_storage_t;

template <typename Storage>
std::optional<uint64_t> create(tender::state::offer_store<Storage>& offers,
                               const tender::schema::amount_t& min_price,
                               const tender::schema::amount_t& min_bid_size) {
  auto created = offers.create(tender::testing::make_address(1),
                               tender::testing::make_address(2),
                               tender::testing::make_address(3), min_price,
                               min_bid_size, 1000, 18);
  if (!created) {
    return std::nullopt;
  }
  return created->first.id;
}

}  // namespace

TEST(offer_store, ids_are_dense_from_one) {
  auto encoder = encoder_t{};
  auto storage =
      tender::storage::make_storage<tender::storage::memory_storage_tag>("o");
  auto journal = tender::state::event_journal<memory_t>{encoder, storage};
  auto offers = tender::state::offer_store<memory_t>{encoder, storage, journal};

  EXPECT_EQ(offers.count(), 0u);
  EXPECT_EQ(create(offers, 5, 1), std::optional<uint64_t>{1});
  EXPECT_EQ(create(offers, 5, 1), std::optional<uint64_t>{2});
  EXPECT_EQ(offers.count(), 2u);
  EXPECT_EQ(journal.last_sequence(), 2u);
}

TEST(offer_store, zero_price_or_size_is_rejected) {
  auto encoder = encoder_t{};
  auto storage =
      tender::storage::make_storage<tender::storage::memory_storage_tag>("o");
  auto journal = tender::state::event_journal<memory_t>{encoder, storage};
  auto offers = tender::state::offer_store<memory_t>{encoder, storage, journal};

  EXPECT_FALSE(create(offers, 0, 1).has_value());
  EXPECT_FALSE(create(offers, 1, 0).has_value());
  EXPECT_EQ(offers.count(), 0u);
  EXPECT_EQ(journal.last_sequence(), 0u);
  EXPECT_FALSE(offers.get(1).has_value());
  EXPECT_EQ(create(offers, 1, 1), std::optional<uint64_t>{1});
}

TEST(offer_store, created_offer_carries_every_field) {
  auto encoder = encoder_t{};
  auto storage =
      tender::storage::make_storage<tender::storage::memory_storage_tag>("o");
  auto journal = tender::state::event_journal<memory_t>{encoder, storage};
  auto offers = tender::state::offer_store<memory_t>{encoder, storage, journal};

  auto created = offers.create(
      tender::testing::make_address(1), tender::testing::make_address(2),
      tender::testing::make_address(3), 1000, 10, 500, 6);
  ASSERT_TRUE(created.has_value());
  const auto& [offer, event] = *created;
  EXPECT_EQ(event.type, tender::schema::kOfferCreatedEvent);
  EXPECT_EQ(event.attribute("offer_id"), "1");
  EXPECT_EQ(event.attribute("min_price"), "1000");
  EXPECT_EQ(event.attribute("offer_token_decimals"), "6");

  auto stored = offers.get(offer.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->seller, tender::testing::make_address(1));
  EXPECT_EQ(stored->offer_token, tender::testing::make_address(2));
  EXPECT_EQ(stored->bid_token, tender::testing::make_address(3));
  EXPECT_EQ(stored->min_price, 1000);
  EXPECT_EQ(stored->min_bid_size, 10);
  EXPECT_EQ(stored->total_size, 500);
  EXPECT_EQ(stored->offer_token_decimals, 6u);
}

TEST(offer_store, counter_survives_reopen) {
  auto db = tender::testing::make_db_path("tender_offer_reopen");
  auto encoder = encoder_t{};
  {
    auto storage =
        tender::storage::make_storage<tender::storage::rocksdb_storage_tag>(db);
    auto journal = tender::state::event_journal<rocksdb_t>{encoder, storage};
    auto offers =
        tender::state::offer_store<rocksdb_t>{encoder, storage, journal};
    ASSERT_EQ(create(offers, 5, 1), std::optional<uint64_t>{1});
    ASSERT_EQ(create(offers, 6, 1), std::optional<uint64_t>{2});
  }
  {
    auto storage =
        tender::storage::make_storage<tender::storage::rocksdb_storage_tag>(db);
    auto journal = tender::state::event_journal<rocksdb_t>{encoder, storage};
    auto offers =
        tender::state::offer_store<rocksdb_t>{encoder, storage, journal};
    EXPECT_EQ(offers.count(), 2u);
    ASSERT_TRUE(offers.get(2).has_value());
    EXPECT_EQ(offers.get(2)->min_price, 6);
    EXPECT_EQ(create(offers, 7, 1), std::optional<uint64_t>{3});
  }
  tender::testing::remove_path(db);
}
