#pragma once

#include <tender/crypto/domain.hpp>
#include <tender/crypto/typed_data.hpp>
#include <tender/execution/bid_validator.hpp>
#include <tender/ledger/token_ledger.hpp>
#include <tender/schema/bid.hpp>
#include <tender/schema/encoding/scale/encoder.hpp>
#include <tender/schema/offer.hpp>
#include <tender/schema/operation_result.hpp>
#include <tender/schema/primitives.hpp>
#include <tender/state/delegation_registry.hpp>
#include <tender/state/event_journal.hpp>
#include <tender/state/nonce_ledger.hpp>
#include <tender/state/offer_store.hpp>
#include <tender/storage/memory/storage.hpp>
#include <tender/storage/rocksdb/storage.hpp>
#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace tender::execution {

/// RFQ settlement engine.
///
/// Sellers post offers; bidders, or signers they delegated to, authorize
/// fills off-chain with typed-data signatures bound to `domain`. The seller
/// submits a signed bid and the engine checks authorization, consumes the
/// signer's nonce and moves both legs through `ledger` in one step.
///
/// The verifying contract of the domain is also the spender identity the
/// engine presents to the ledger.
template <typename Storage>
class engine final {
 public:
  engine(tender::schema::encoding::scale_encoder_t& encoder,
         Storage& storage,
         tender::ledger::token_ledger& ledger,
         tender::crypto::domain_context domain);

  /// Register a new offer owned by `caller`. On success `data` holds the
  /// SCALE-encoded offer id.
  tender::schema::operation_result_t create_offer(
      const tender::schema::address_t& caller,
      const tender::schema::address_t& offer_token,
      const tender::schema::address_t& bid_token,
      const tender::schema::amount_t& min_price,
      const tender::schema::amount_t& min_bid_size,
      const tender::schema::amount_t& total_size);

  /// Let `new_signer` sign bids on behalf of `caller`, replacing any previous
  /// delegate.
  tender::schema::operation_result_t delegate_to_signer(
      const tender::schema::address_t& caller,
      const tender::schema::address_t& new_signer);

  /// Settle `bid` against offer `offer_id`. Only the offer's seller may call.
  ///
  /// Once authorization passes, the signer's nonce is consumed even if the
  /// signature or the transfer subsequently fails.
  tender::schema::operation_result_t settle_offer(
      const tender::schema::address_t& caller,
      uint64_t offer_id,
      const tender::schema::bid_t& bid);

  /// Pre-flight check of `bid` against its offer and the current nonce,
  /// delegation and allowance state. Read-only.
  tender::schema::check_result_t check_bid(
      const tender::schema::bid_t& bid) const;

  /// Address that signed `bid` at the signer's current nonce.
  tender::schema::signer_result_t get_bid_signer(
      const tender::schema::bid_t& bid) const;

  /// Address that signed `payload` at the account's current nonce.
  tender::schema::signer_result_t get_test_signer(
      const tender::crypto::test_payload_t& payload,
      const tender::schema::signature_t& signature) const;

  uint64_t nonces(const tender::schema::address_t& signer) const;

  std::optional<tender::schema::offer_details_t> get_offer_details(
      uint64_t offer_id) const;

  std::optional<tender::schema::address_t> delegate_of(
      const tender::schema::address_t& bidder) const;

  /// Deliver every future notification to `sink`. Sinks run after the
  /// operation that emitted the event has released its locks, so they may
  /// call back into the engine. Exceptions thrown by a sink are logged.
  void subscribe(tender::state::event_sink_t sink);

  std::vector<tender::state::journal_entry_t> events(uint64_t from,
                                                     uint64_t to) const;
  tender::schema::hash32_t journal_root() const;

  const tender::crypto::domain_context& domain() const { return domain_; }

 private:
  static constexpr std::size_t kSettlementStripeCount = 32;

  std::mutex& settlement_lock_for(uint64_t offer_id);

  tender::schema::operation_result_t settle_locked(
      const tender::schema::address_t& caller,
      uint64_t offer_id,
      const tender::schema::bid_t& bid);

  tender::schema::encoding::scale_encoder_t& encoder_;
  tender::ledger::token_ledger& ledger_;
  tender::crypto::domain_context domain_;
  tender::state::event_journal<Storage> journal_;
  tender::state::nonce_ledger<Storage> nonces_;
  tender::state::delegation_registry<Storage> delegations_;
  tender::state::offer_store<Storage> offers_;
  std::array<std::mutex, kSettlementStripeCount> settlement_stripes_;
};

extern template class engine<tender::storage::rocksdb_storage_t>;
extern template class engine<tender::storage::memory_storage_t>;

}  // namespace tender::execution
