#include <tender/crypto/domain.hpp>
#include <tender/crypto/keccak.hpp>
#include <tender/crypto/typed_data.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace tender::crypto {

domain_context::domain_context(
    std::string name,
    std::string version,
    const uint64_t chain_id,
    const tender::schema::address_t& verifying_contract)
    : name_{std::move(name)},
      version_{std::move(version)},
      chain_id_{chain_id},
      verifying_contract_{verifying_contract} {
  auto encoded = abi_encoder{};
  encoded.word(type_hash(kDomainType))
      .word(keccak256(name_))
      .word(keccak256(version_))
      .uint256(chain_id_)
      .address(verifying_contract_);
  separator_ = keccak256(encoded.data);
  spdlog::debug("Domain '{}' v{} on chain {} verifying {} -> {}", name_,
                version_, chain_id_,
                tender::schema::to_string(verifying_contract_),
                tender::schema::to_string(separator_));
}

}  // namespace tender::crypto
