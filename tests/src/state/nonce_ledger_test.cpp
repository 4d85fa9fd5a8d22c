#include <gtest/gtest.h>
#include <tender/state/nonce_ledger.hpp>
#include <tender/testing/common.hpp>

#include <algorithm>
#include <thread>
#include <vector>

namespace {

using encoder_t = tender::schema::encoding::scale_encoder_t;
using memory_ledger_t =
    tender::state::nonce_ledger<tender::storage::memory_storage_t>;
using rocksdb_ledger_t =
    tender::state::nonce_ledger<tender::storage::rocksdb_storage_t>;

}  // namespace

TEST(nonce_ledger, unseen_signer_starts_at_zero) {
  auto encoder = encoder_t{};
  auto storage =
      tender::storage::make_storage<tender::storage::memory_storage_tag>("n");
  auto nonces = memory_ledger_t{encoder, storage};
  auto signer = tender::testing::make_address(1);
  EXPECT_EQ(nonces.current(signer), 0u);
  EXPECT_EQ(nonces.current(signer), 0u);
}

TEST(nonce_ledger, consume_returns_previous_value) {
  auto encoder = encoder_t{};
  auto storage =
      tender::storage::make_storage<tender::storage::memory_storage_tag>("n");
  auto nonces = memory_ledger_t{encoder, storage};
  auto signer = tender::testing::make_address(1);
  auto other = tender::testing::make_address(2);

  EXPECT_EQ(nonces.consume(signer), 0u);
  EXPECT_EQ(nonces.consume(signer), 1u);
  EXPECT_EQ(nonces.current(signer), 2u);
  EXPECT_EQ(nonces.current(other), 0u);
}

TEST(nonce_ledger, concurrent_consumers_never_share_a_nonce) {
  auto encoder = encoder_t{};
  auto storage =
      tender::storage::make_storage<tender::storage::memory_storage_tag>("n");
  auto nonces = memory_ledger_t{encoder, storage};
  auto signer = tender::testing::make_address(7);

  constexpr auto kThreads = 8;
  constexpr auto kPerThread = 100;
  auto seen = std::vector<std::vector<uint64_t>>(kThreads);
  auto threads = std::vector<std::thread>{};
  for (auto t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (auto i = 0; i < kPerThread; ++i) {
        seen[t].push_back(nonces.consume(signer));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  auto all = std::vector<uint64_t>{};
  for (const auto& values : seen) {
    all.insert(std::end(all), std::begin(values), std::end(values));
  }
  std::sort(std::begin(all), std::end(all));
  ASSERT_EQ(all.size(), static_cast<std::size_t>(kThreads * kPerThread));
  for (std::size_t i = 0; i < all.size(); ++i) {
    EXPECT_EQ(all[i], i);
  }
  EXPECT_EQ(nonces.current(signer), all.size());
}

TEST(nonce_ledger, nonces_survive_reopen) {
  auto db = tender::testing::make_db_path("tender_nonce_reopen");
  auto signer = tender::testing::make_address(3);
  auto encoder = encoder_t{};
  {
    auto storage =
        tender::storage::make_storage<tender::storage::rocksdb_storage_tag>(db);
    auto nonces = rocksdb_ledger_t{encoder, storage};
    nonces.consume(signer);
    nonces.consume(signer);
  }
  {
    auto storage =
        tender::storage::make_storage<tender::storage::rocksdb_storage_tag>(db);
    auto nonces = rocksdb_ledger_t{encoder, storage};
    EXPECT_EQ(nonces.current(signer), 2u);
    EXPECT_EQ(nonces.consume(signer), 2u);
  }
  tender::testing::remove_path(db);
}
