#include <spdlog/spdlog.h>
#include <tender/crypto/recover.hpp>
#include <tender/execution/engine.hpp>
#include <iterator>
#include <string>
#include <utility>

using namespace tender::schema;

namespace {

void fail(operation_result_t& result,
          const error_code code,
          std::string log,
          std::string info,
          std::string codespace) {
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::move(codespace);
  spdlog::warn("{} rejected ({}): {} {}", result.codespace, to_string(code),
               result.log, result.info);
}

event_t make_settlement_completed_event(const offer_t& offer,
                                        const bid_t& bid,
                                        const uint64_t nonce) {
  auto event = event_t{};
  event.type = std::string{kSettlementCompletedEvent};
  event.attributes = {
      event_attribute_t{.key = "offer_id",
                        .value = std::to_string(offer.id),
                        .index = true},
      event_attribute_t{.key = "bid_id",
                        .value = std::to_string(bid.bid_id),
                        .index = true},
      event_attribute_t{.key = "seller",
                        .value = to_string(offer.seller),
                        .index = true},
      event_attribute_t{.key = "bidder",
                        .value = to_string(bid.bidder_address),
                        .index = true},
      event_attribute_t{.key = "signer", .value = to_string(bid.signer_address)},
      event_attribute_t{.key = "offer_token",
                        .value = to_string(offer.offer_token)},
      event_attribute_t{.key = "bid_token", .value = to_string(offer.bid_token)},
      event_attribute_t{.key = "bid_amount", .value = bid.bid_amount.str()},
      event_attribute_t{.key = "sell_amount", .value = bid.sell_amount.str()},
      event_attribute_t{.key = "nonce", .value = std::to_string(nonce)}};
  return event;
}

}  // namespace

namespace tender::execution {

template <typename Storage>
engine<Storage>::engine(tender::schema::encoding::scale_encoder_t& encoder,
                        Storage& storage,
                        tender::ledger::token_ledger& ledger,
                        tender::crypto::domain_context domain)
    : encoder_{encoder},
      ledger_{ledger},
      domain_{std::move(domain)},
      journal_{encoder, storage},
      nonces_{encoder, storage},
      delegations_{storage, journal_},
      offers_{encoder, storage, journal_} {
  if (!tender::crypto::available()) {
    tender::common::critical("secp256k1 context unavailable");
  }
  spdlog::info("Settlement engine ready for domain '{}' v{} on chain {}",
               domain_.name(), domain_.version(), domain_.chain_id());
  spdlog::info("Domain separator {}, {} offer(s), journal at {}",
               to_string(domain_.separator()), offers_.count(),
               journal_.last_sequence());
}

template <typename Storage>
operation_result_t engine<Storage>::create_offer(const address_t& caller,
                                                 const address_t& offer_token,
                                                 const address_t& bid_token,
                                                 const amount_t& min_price,
                                                 const amount_t& min_bid_size,
                                                 const amount_t& total_size) {
  auto result = operation_result_t{};
  auto created =
      offers_.create(caller, offer_token, bid_token, min_price, min_bid_size,
                     total_size, ledger_.decimals(offer_token));
  if (!created) {
    fail(result, error_code::invalid_parameter, "invalid offer parameters",
         "min_price and min_bid_size must be non-zero", "tender.offer");
    return result;
  }

  auto& [offer, event] = *created;
  result.data = encoder_.encode(offer.id);
  result.info = "offer " + std::to_string(offer.id) + " created";
  result.events.push_back(std::move(event));
  journal_.publish();
  return result;
}

template <typename Storage>
operation_result_t engine<Storage>::delegate_to_signer(
    const address_t& caller,
    const address_t& new_signer) {
  auto result = operation_result_t{};
  auto event = delegations_.delegate(caller, new_signer);
  if (!event) {
    fail(result, error_code::invalid_parameter, "invalid delegate",
         "delegate must not be the null address", "tender.delegate");
    return result;
  }
  result.events.push_back(std::move(*event));
  journal_.publish();
  return result;
}

template <typename Storage>
operation_result_t engine<Storage>::settle_offer(const address_t& caller,
                                                 const uint64_t offer_id,
                                                 const bid_t& bid) {
  auto result = settle_locked(caller, offer_id, bid);
  journal_.publish();
  return result;
}

template <typename Storage>
operation_result_t engine<Storage>::settle_locked(const address_t& caller,
                                                  const uint64_t offer_id,
                                                  const bid_t& bid) {
  auto lock = std::scoped_lock{settlement_lock_for(offer_id)};
  auto result = operation_result_t{};

  auto offer = offers_.get(offer_id);
  if (!offer) {
    fail(result, error_code::not_found, "offer not found",
         "offer " + std::to_string(offer_id), "tender.settle");
    return result;
  }
  if (caller != offer->seller) {
    fail(result, error_code::unauthorized, "caller is not the seller",
         to_string(caller), "tender.settle");
    return result;
  }
  if (bid.offer_id != offer_id || bid.bid_token != offer->bid_token ||
      bid.offer_token != offer->offer_token ||
      bid.bid_amount < offer->min_bid_size) {
    fail(result, error_code::inconsistent_offer,
         "bid does not match offer", "bid " + std::to_string(bid.bid_id),
         "tender.settle");
    return result;
  }
  if (bid.bidder_address != bid.signer_address &&
      !delegations_.is_authorized_signer(bid.bidder_address,
                                         bid.signer_address)) {
    fail(result, error_code::invalid_delegate,
         "signer is not authorized for bidder",
         to_string(bid.signer_address), "tender.settle");
    return result;
  }

  // The nonce stays consumed from here on, whatever the outcome.
  auto nonce = nonces_.consume(bid.signer_address);
  auto digest = tender::crypto::digest_for_bid(domain_, bid, nonce);
  spdlog::debug("Settling offer {} bid {} digest {}", offer_id, bid.bid_id,
                to_string(digest));

  auto recovered = tender::crypto::recover_signer(digest, bid.signature);
  if (!recovered || *recovered != bid.signer_address) {
    fail(result, error_code::invalid_signature, "invalid signature",
         "nonce " + std::to_string(nonce), "tender.settle");
    return result;
  }

  auto legs = std::vector<tender::ledger::transfer_leg_t>{
      tender::ledger::transfer_leg_t{.token = offer->offer_token,
                                     .owner = offer->seller,
                                     .recipient = bid.bidder_address,
                                     .amount = bid.bid_amount},
      tender::ledger::transfer_leg_t{.token = offer->bid_token,
                                     .owner = bid.bidder_address,
                                     .recipient = offer->seller,
                                     .amount = bid.sell_amount}};
  if (!ledger_.transfer_all(domain_.verifying_contract(), legs)) {
    fail(result, error_code::transfer_failed, "transfer failed",
         "offer " + std::to_string(offer_id), "tender.settle");
    return result;
  }

  auto event = make_settlement_completed_event(*offer, bid, nonce);
  auto batch = tender::storage::write_batch{};
  journal_.commit(batch, {event});
  result.events.push_back(std::move(event));
  spdlog::info("Settled offer {} bid {}: {} to {}", offer_id, bid.bid_id,
               bid.bid_amount.str(), to_string(bid.bidder_address));
  return result;
}

template <typename Storage>
check_result_t engine<Storage>::check_bid(const bid_t& bid) const {
  auto offer = offers_.get(bid.offer_id);
  if (!offer) {
    auto result = check_result_t{};
    result.code = static_cast<uint32_t>(error_code::not_found);
    result.log = "offer not found";
    result.codespace = "tender.query";
    return result;
  }

  const auto& spender = domain_.verifying_contract();
  auto facts = bid_facts_t{};
  facts.recovered_signer = tender::crypto::recover_signer(
      tender::crypto::digest_for_bid(domain_, bid,
                                     nonces_.current(bid.signer_address)),
      bid.signature);
  facts.authorized_signer = delegations_.is_authorized_signer(
      bid.bidder_address, bid.signer_address);
  facts.bidder_allowance =
      ledger_.allowance(offer->bid_token, bid.bidder_address, spender);
  facts.seller_allowance =
      ledger_.allowance(offer->offer_token, offer->seller, spender);
  return tender::execution::check_bid(*offer, bid, facts);
}

template <typename Storage>
signer_result_t engine<Storage>::get_bid_signer(const bid_t& bid) const {
  auto result = signer_result_t{};
  auto digest = tender::crypto::digest_for_bid(
      domain_, bid, nonces_.current(bid.signer_address));
  auto recovered = tender::crypto::recover_signer(digest, bid.signature);
  if (!recovered) {
    result.code = static_cast<uint32_t>(error_code::invalid_signature);
    result.log = "malformed signature";
    result.codespace = "tender.query";
    return result;
  }
  result.signer = *recovered;
  return result;
}

template <typename Storage>
signer_result_t engine<Storage>::get_test_signer(
    const tender::crypto::test_payload_t& payload,
    const signature_t& signature) const {
  auto result = signer_result_t{};
  auto digest = tender::crypto::digest_for_test_payload(
      domain_, payload, nonces_.current(payload.account));
  auto recovered = tender::crypto::recover_signer(digest, signature);
  if (!recovered) {
    result.code = static_cast<uint32_t>(error_code::invalid_signature);
    result.log = "malformed signature";
    result.codespace = "tender.query";
    return result;
  }
  result.signer = *recovered;
  return result;
}

template <typename Storage>
uint64_t engine<Storage>::nonces(const address_t& signer) const {
  return nonces_.current(signer);
}

template <typename Storage>
std::optional<offer_details_t> engine<Storage>::get_offer_details(
    const uint64_t offer_id) const {
  auto offer = offers_.get(offer_id);
  if (!offer) {
    return std::nullopt;
  }
  return offer_details_t{.seller = offer->seller,
                         .offer_token = offer->offer_token,
                         .bid_token = offer->bid_token,
                         .min_price = offer->min_price,
                         .min_bid_size = offer->min_bid_size};
}

template <typename Storage>
std::optional<address_t> engine<Storage>::delegate_of(
    const address_t& bidder) const {
  return delegations_.delegate_of(bidder);
}

template <typename Storage>
void engine<Storage>::subscribe(tender::state::event_sink_t sink) {
  journal_.subscribe(std::move(sink));
}

template <typename Storage>
std::vector<tender::state::journal_entry_t> engine<Storage>::events(
    const uint64_t from,
    const uint64_t to) const {
  return journal_.events(from, to);
}

template <typename Storage>
hash32_t engine<Storage>::journal_root() const {
  return journal_.root();
}

template <typename Storage>
std::mutex& engine<Storage>::settlement_lock_for(const uint64_t offer_id) {
  return settlement_stripes_[offer_id % kSettlementStripeCount];
}

template class engine<tender::storage::rocksdb_storage_t>;
template class engine<tender::storage::memory_storage_t>;

}  // namespace tender::execution
