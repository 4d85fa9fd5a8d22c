#include <spdlog/spdlog.h>
#include <tender/schema/key/keys.hpp>
#include <tender/state/nonce_ledger.hpp>

using namespace tender::schema;

namespace tender::state {

template <typename Storage>
nonce_ledger<Storage>::nonce_ledger(
    tender::schema::encoding::scale_encoder_t& encoder,
    Storage& storage)
    : encoder_{encoder}, storage_{storage} {}

template <typename Storage>
uint64_t nonce_ledger<Storage>::current(const address_t& signer) const {
  return load(signer);
}

template <typename Storage>
uint64_t nonce_ledger<Storage>::consume(const address_t& signer) {
  auto lock = std::scoped_lock{stripe_for(signer)};
  auto nonce = load(signer);
  auto key = key::make_nonce_key(signer);
  storage_.put(encoder_, bytes_view_t{key.data(), key.size()}, nonce + 1);
  spdlog::debug("Consumed nonce {} for {}", nonce, to_string(signer));
  return nonce;
}

template <typename Storage>
uint64_t nonce_ledger<Storage>::load(const address_t& signer) const {
  auto key = key::make_nonce_key(signer);
  return storage_
      .template get<uint64_t>(encoder_, bytes_view_t{key.data(), key.size()})
      .value_or(0);
}

template <typename Storage>
std::mutex& nonce_ledger<Storage>::stripe_for(const address_t& signer) {
  auto folded = std::size_t{};
  for (const auto byte : signer) {
    folded = (folded * 31) + byte;
  }
  return stripes_[folded % kStripeCount];
}

template class nonce_ledger<tender::storage::rocksdb_storage_t>;
template class nonce_ledger<tender::storage::memory_storage_t>;

}  // namespace tender::state
