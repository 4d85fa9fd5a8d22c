#pragma once
#include <tender/schema/encoding/scale/encoder.hpp>
#include <tender/schema/event.hpp>
#include <tender/schema/offer.hpp>
#include <tender/schema/primitives.hpp>
#include <tender/state/event_journal.hpp>
#include <tender/storage/memory/storage.hpp>
#include <tender/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

namespace tender::state {

/// Registry of standing offers keyed by a dense id starting at 1.
template <typename Storage>
class offer_store final {
 public:
  offer_store(tender::schema::encoding::scale_encoder_t& encoder,
              Storage& storage,
              event_journal<Storage>& journal);

  /// Assign the next id, persist the offer and journal `offer_created` in one
  /// batch. Returns std::nullopt, writing nothing, when `min_price` or
  /// `min_bid_size` is zero.
  std::optional<std::pair<tender::schema::offer_t, tender::schema::event_t>>
  create(const tender::schema::address_t& seller,
         const tender::schema::address_t& offer_token,
         const tender::schema::address_t& bid_token,
         const tender::schema::amount_t& min_price,
         const tender::schema::amount_t& min_bid_size,
         const tender::schema::amount_t& total_size,
         uint8_t offer_token_decimals);

  std::optional<tender::schema::offer_t> get(uint64_t offer_id) const;

  /// Number of offers created so far.
  uint64_t count() const;

 private:
  mutable std::mutex mutex_;
  tender::schema::encoding::scale_encoder_t& encoder_;
  Storage& storage_;
  event_journal<Storage>& journal_;
  uint64_t next_id_{1};
};

extern template class offer_store<tender::storage::rocksdb_storage_t>;
extern template class offer_store<tender::storage::memory_storage_t>;

}  // namespace tender::state
