#pragma once
#include <tender/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace tender::crypto {

/// Domain separation parameters and the separator derived from them.
///
/// The separator binds every signature to one protocol name, version, chain
/// and verifying authority. It is computed once in the constructor.
class domain_context final {
 public:
  domain_context(std::string name,
                 std::string version,
                 uint64_t chain_id,
                 const tender::schema::address_t& verifying_contract);

  const std::string& name() const { return name_; }
  const std::string& version() const { return version_; }
  uint64_t chain_id() const { return chain_id_; }
  const tender::schema::address_t& verifying_contract() const {
    return verifying_contract_;
  }
  const tender::schema::hash32_t& separator() const { return separator_; }

 private:
  std::string name_;
  std::string version_;
  uint64_t chain_id_{};
  tender::schema::address_t verifying_contract_{};
  tender::schema::hash32_t separator_{};
};

}  // namespace tender::crypto
