#include <spdlog/spdlog.h>
#include <tender/common/critical.hpp>
#include <tender/schema/key/keys.hpp>
#include <tender/state/offer_store.hpp>

using namespace tender::schema;

namespace {

event_t make_offer_created_event(const offer_t& offer) {
  auto event = event_t{};
  event.type = std::string{kOfferCreatedEvent};
  event.attributes = {
      event_attribute_t{.key = "offer_id",
                        .value = std::to_string(offer.id),
                        .index = true},
      event_attribute_t{.key = "seller",
                        .value = to_string(offer.seller),
                        .index = true},
      event_attribute_t{.key = "offer_token",
                        .value = to_string(offer.offer_token),
                        .index = true},
      event_attribute_t{.key = "bid_token",
                        .value = to_string(offer.bid_token),
                        .index = true},
      event_attribute_t{.key = "min_price", .value = offer.min_price.str()},
      event_attribute_t{.key = "min_bid_size",
                        .value = offer.min_bid_size.str()},
      event_attribute_t{.key = "total_size", .value = offer.total_size.str()},
      event_attribute_t{.key = "offer_token_decimals",
                        .value = std::to_string(offer.offer_token_decimals)}};
  return event;
}

}  // namespace

namespace tender::state {

template <typename Storage>
offer_store<Storage>::offer_store(
    tender::schema::encoding::scale_encoder_t& encoder,
    Storage& storage,
    event_journal<Storage>& journal)
    : encoder_{encoder}, storage_{storage}, journal_{journal} {
  auto lock = std::scoped_lock{mutex_};
  auto key = key::make_next_offer_id_key();
  if (auto next = storage_.template get<uint64_t>(
          encoder_, bytes_view_t{key.data(), key.size()})) {
    next_id_ = *next;
  }
  if (next_id_ == 0) {
    tender::common::critical("corrupt offer id counter");
  }
}

template <typename Storage>
std::optional<std::pair<offer_t, event_t>> offer_store<Storage>::create(
    const address_t& seller,
    const address_t& offer_token,
    const address_t& bid_token,
    const amount_t& min_price,
    const amount_t& min_bid_size,
    const amount_t& total_size,
    uint8_t offer_token_decimals) {
  if (min_price == 0 || min_bid_size == 0) {
    return std::nullopt;
  }

  auto lock = std::scoped_lock{mutex_};
  auto offer = offer_t{};
  offer.id = next_id_;
  offer.seller = seller;
  offer.offer_token = offer_token;
  offer.bid_token = bid_token;
  offer.min_price = min_price;
  offer.min_bid_size = min_bid_size;
  offer.total_size = total_size;
  offer.offer_token_decimals = offer_token_decimals;

  auto event = make_offer_created_event(offer);
  auto batch = tender::storage::write_batch{};
  batch.put(encoder_, key::make_offer_key(offer.id), offer);
  batch.put(encoder_, key::make_next_offer_id_key(), offer.id + 1);
  // The id is taken before the write; a failed write is fatal.
  next_id_ = offer.id + 1;
  journal_.commit(batch, {event});

  spdlog::info("Created offer {} for seller {}", offer.id,
               to_string(offer.seller));
  return std::pair{offer, event};
}

template <typename Storage>
std::optional<offer_t> offer_store<Storage>::get(uint64_t offer_id) const {
  auto key = key::make_offer_key(offer_id);
  return storage_.template get<offer_t>(encoder_,
                                        bytes_view_t{key.data(), key.size()});
}

template <typename Storage>
uint64_t offer_store<Storage>::count() const {
  auto lock = std::scoped_lock{mutex_};
  return next_id_ - 1;
}

template class offer_store<tender::storage::rocksdb_storage_t>;
template class offer_store<tender::storage::memory_storage_t>;

}  // namespace tender::state
