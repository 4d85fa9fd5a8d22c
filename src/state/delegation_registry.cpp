#include <spdlog/spdlog.h>
#include <tender/common/critical.hpp>
#include <tender/schema/key/keys.hpp>
#include <tender/state/delegation_registry.hpp>
#include <algorithm>

using namespace tender::schema;

namespace tender::state {

template <typename Storage>
delegation_registry<Storage>::delegation_registry(
    Storage& storage,
    event_journal<Storage>& journal)
    : storage_{storage}, journal_{journal} {}

template <typename Storage>
std::optional<event_t> delegation_registry<Storage>::delegate(
    const address_t& bidder,
    const address_t& signer) {
  if (is_zero(signer)) {
    return std::nullopt;
  }

  auto event = event_t{};
  event.type = std::string{kDelegationChangedEvent};
  event.attributes = {event_attribute_t{.key = "bidder",
                                        .value = to_string(bidder),
                                        .index = true},
                      event_attribute_t{.key = "signer",
                                        .value = to_string(signer),
                                        .index = true}};

  auto batch = tender::storage::write_batch{};
  batch.put(key::make_delegation_key(bidder),
            bytes_t{std::begin(signer), std::end(signer)});
  journal_.commit(batch, {event});
  spdlog::info("Delegated signing for {} to {}", to_string(bidder),
               to_string(signer));
  return event;
}

template <typename Storage>
std::optional<address_t> delegation_registry<Storage>::delegate_of(
    const address_t& bidder) const {
  auto key = key::make_delegation_key(bidder);
  auto raw = storage_.get_raw(bytes_view_t{key.data(), key.size()});
  if (!raw) {
    return std::nullopt;
  }
  auto signer = address_t{};
  if (raw->size() != signer.size()) {
    tender::common::critical("corrupt delegation record");
  }
  std::copy(std::begin(*raw), std::end(*raw), std::begin(signer));
  return signer;
}

template <typename Storage>
bool delegation_registry<Storage>::is_authorized_signer(
    const address_t& bidder,
    const address_t& signer) const {
  if (signer == bidder) {
    return true;
  }
  auto delegate = delegate_of(bidder);
  return delegate && *delegate == signer;
}

template class delegation_registry<tender::storage::rocksdb_storage_t>;
template class delegation_registry<tender::storage::memory_storage_t>;

}  // namespace tender::state
