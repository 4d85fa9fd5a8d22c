#pragma once

#include <tender/crypto/domain.hpp>
#include <tender/crypto/recover.hpp>
#include <tender/crypto/typed_data.hpp>
#include <tender/execution/engine.hpp>
#include <tender/ledger/memory_ledger.hpp>
#include <tender/schema/bid.hpp>
#include <tender/schema/encoding/scale/encoder.hpp>
#include <tender/schema/primitives.hpp>
#include <tender/storage/rocksdb/storage.hpp>
#include <tender/testing/common.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace tender::testing {

using engine_t = tender::execution::engine<tender::storage::rocksdb_storage_t>;

inline tender::crypto::domain_context make_domain() {
  return tender::crypto::domain_context{"tender", "1", 1,
                                        make_address(0xEC)};
}

/// RocksDB-backed engine with a funded seller, bidder and delegate.
///
/// Amounts follow a 18-decimal offer token priced in a 6-decimal bid token:
/// the default offer asks at least 1000 bid units per whole offer token.
class engine_fixture final {
 public:
  explicit engine_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{tender::storage::make_storage<
            tender::storage::rocksdb_storage_tag>(db_path_)},
        ledger_{},
        engine_{encoder_, storage_, ledger_, make_domain()} {
    ledger_.set_decimals(offer_token(), 18);
    ledger_.set_decimals(bid_token(), 6);

    ledger_.mint(offer_token(), seller(), make_amount("100000000000000000000"));
    ledger_.approve(offer_token(), seller(), spender(),
                    make_amount("100000000000000000000"));
    ledger_.mint(bid_token(), bidder(), make_amount("1000000000000"));
    ledger_.approve(bid_token(), bidder(), spender(),
                    make_amount("1000000000000"));
  }

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;
  engine_fixture(engine_fixture&&) = delete;
  engine_fixture& operator=(engine_fixture&&) = delete;

  ~engine_fixture() { remove_path(db_path_); }

  const std::string& db_path() const { return db_path_; }
  tender::schema::encoding::scale_encoder_t& encoder() { return encoder_; }
  tender::storage::rocksdb_storage_t& storage() { return storage_; }
  tender::ledger::memory_ledger& ledger() { return ledger_; }
  engine_t& engine() { return engine_; }

  static tender::schema::private_key_t seller_key() {
    return make_private_key(1);
  }
  static tender::schema::private_key_t bidder_key() {
    return make_private_key(2);
  }
  static tender::schema::private_key_t delegate_key() {
    return make_private_key(3);
  }

  static tender::schema::address_t seller() { return address_of(seller_key()); }
  static tender::schema::address_t bidder() { return address_of(bidder_key()); }
  static tender::schema::address_t delegate() {
    return address_of(delegate_key());
  }
  static tender::schema::address_t offer_token() { return make_address(0xA0); }
  static tender::schema::address_t bid_token() { return make_address(0xB0); }
  static tender::schema::address_t spender() {
    return make_domain().verifying_contract();
  }

  /// min_price 1000e6, min_bid_size 1e18, total_size 100e18.
  uint64_t create_default_offer() {
    auto result = engine_.create_offer(
        seller(), offer_token(), bid_token(), make_amount("1000000000"),
        make_amount("1000000000000000000"),
        make_amount("100000000000000000000"));
    return encoder_.decode<uint64_t>(
        tender::schema::bytes_view_t{result.data.data(), result.data.size()});
  }

  /// 10 whole offer tokens for 10000 bid tokens, exactly the minimum price.
  tender::schema::bid_t make_bid(const uint64_t offer_id,
                                 const uint64_t bid_id,
                                 const tender::schema::address_t& signer) {
    auto bid = tender::schema::bid_t{};
    bid.offer_id = offer_id;
    bid.bid_id = bid_id;
    bid.signer_address = signer;
    bid.bidder_address = bidder();
    bid.bid_token = bid_token();
    bid.offer_token = offer_token();
    bid.bid_amount = make_amount("10000000000000000000");
    bid.sell_amount = make_amount("10000000000");
    return bid;
  }

  /// Sign `bid` with `key` at `nonce`.
  void sign(tender::schema::bid_t& bid,
            const tender::schema::private_key_t& key,
            const uint64_t nonce) {
    auto digest =
        tender::crypto::digest_for_bid(engine_.domain(), bid, nonce);
    bid.signature = tender::crypto::sign_digest(key, digest).value();
  }

  /// Sign `bid` with `key` at the signer's current nonce.
  void sign(tender::schema::bid_t& bid,
            const tender::schema::private_key_t& key) {
    sign(bid, key, engine_.nonces(bid.signer_address));
  }

 private:
  std::string db_path_;
  tender::schema::encoding::scale_encoder_t encoder_;
  tender::storage::rocksdb_storage_t storage_;
  tender::ledger::memory_ledger ledger_;
  engine_t engine_;
};

}  // namespace tender::testing
