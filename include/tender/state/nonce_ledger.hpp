#pragma once
#include <tender/schema/encoding/scale/encoder.hpp>
#include <tender/schema/primitives.hpp>
#include <tender/storage/memory/storage.hpp>
#include <tender/storage/rocksdb/storage.hpp>
#include <array>
#include <cstdint>
#include <mutex>

namespace tender::state {

/// Per-signer replay counter.
///
/// Every signer starts at 0. `consume` hands out the current value and
/// persists the successor before returning, so two callers never observe the
/// same nonce for one signer. Signers are spread over a fixed set of lock
/// stripes; unrelated signers rarely contend.
template <typename Storage>
class nonce_ledger final {
 public:
  nonce_ledger(tender::schema::encoding::scale_encoder_t& encoder,
               Storage& storage);

  /// Next nonce the signer is expected to sign with. No side effects.
  uint64_t current(const tender::schema::address_t& signer) const;

  /// Return the current nonce and advance the persisted value by one.
  uint64_t consume(const tender::schema::address_t& signer);

 private:
  static constexpr std::size_t kStripeCount = 64;

  uint64_t load(const tender::schema::address_t& signer) const;
  std::mutex& stripe_for(const tender::schema::address_t& signer);

  tender::schema::encoding::scale_encoder_t& encoder_;
  Storage& storage_;
  std::array<std::mutex, kStripeCount> stripes_;
};

extern template class nonce_ledger<tender::storage::rocksdb_storage_t>;
extern template class nonce_ledger<tender::storage::memory_storage_t>;

}  // namespace tender::state
