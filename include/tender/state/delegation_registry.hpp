#pragma once
#include <tender/schema/event.hpp>
#include <tender/schema/primitives.hpp>
#include <tender/state/event_journal.hpp>
#include <tender/storage/memory/storage.hpp>
#include <tender/storage/rocksdb/storage.hpp>
#include <optional>

namespace tender::state {

/// One optional delegate per bidder. A bidder may always sign for itself;
/// the delegate, when set, may sign on its behalf as well.
template <typename Storage>
class delegation_registry final {
 public:
  delegation_registry(Storage& storage, event_journal<Storage>& journal);

  /// Replace the bidder's delegate and journal `delegation_changed`.
  /// Returns the emitted event, or std::nullopt when `signer` is the null
  /// address (nothing is written).
  std::optional<tender::schema::event_t> delegate(
      const tender::schema::address_t& bidder,
      const tender::schema::address_t& signer);

  std::optional<tender::schema::address_t> delegate_of(
      const tender::schema::address_t& bidder) const;

  bool is_authorized_signer(const tender::schema::address_t& bidder,
                            const tender::schema::address_t& signer) const;

 private:
  Storage& storage_;
  event_journal<Storage>& journal_;
};

extern template class delegation_registry<tender::storage::rocksdb_storage_t>;
extern template class delegation_registry<tender::storage::memory_storage_t>;

}  // namespace tender::state
