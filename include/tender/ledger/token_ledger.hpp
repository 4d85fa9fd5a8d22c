#pragma once
#include <tender/schema/primitives.hpp>
#include <cstdint>
#include <vector>

namespace tender::ledger {

/// One movement of `amount` of `token` from `owner` to `recipient`, pulled by
/// a spender against the owner's allowance.
struct transfer_leg_t final {
  tender::schema::address_t token{};
  tender::schema::address_t owner{};
  tender::schema::address_t recipient{};
  tender::schema::amount_t amount{};
};

/// Value-transfer collaborator the engine settles through. Balances and
/// allowances live behind this interface; the engine never holds funds.
class token_ledger {
 public:
  virtual ~token_ledger() = default;

  virtual tender::schema::amount_t allowance(
      const tender::schema::address_t& token,
      const tender::schema::address_t& owner,
      const tender::schema::address_t& spender) const = 0;

  virtual bool transfer_from(const tender::schema::address_t& token,
                             const tender::schema::address_t& spender,
                             const tender::schema::address_t& owner,
                             const tender::schema::address_t& recipient,
                             const tender::schema::amount_t& amount) = 0;

  /// Apply every leg or none of them.
  virtual bool transfer_all(const tender::schema::address_t& spender,
                            const std::vector<transfer_leg_t>& legs) = 0;

  /// Number of decimal places of one whole unit of `token`.
  virtual uint8_t decimals(const tender::schema::address_t& token) const = 0;
};

}  // namespace tender::ledger
