#pragma once
#include <tender/ledger/token_ledger.hpp>
#include <map>
#include <mutex>
#include <tuple>

namespace tender::ledger {

/// In-process ledger with ERC-20 style balances and allowances.
class memory_ledger final : public token_ledger {
 public:
  static constexpr uint8_t kDefaultDecimals = 18;

  void mint(const tender::schema::address_t& token,
            const tender::schema::address_t& owner,
            const tender::schema::amount_t& amount);
  void approve(const tender::schema::address_t& token,
               const tender::schema::address_t& owner,
               const tender::schema::address_t& spender,
               const tender::schema::amount_t& amount);
  void set_decimals(const tender::schema::address_t& token, uint8_t decimals);

  tender::schema::amount_t balance_of(
      const tender::schema::address_t& token,
      const tender::schema::address_t& owner) const;

  tender::schema::amount_t allowance(
      const tender::schema::address_t& token,
      const tender::schema::address_t& owner,
      const tender::schema::address_t& spender) const override;

  bool transfer_from(const tender::schema::address_t& token,
                     const tender::schema::address_t& spender,
                     const tender::schema::address_t& owner,
                     const tender::schema::address_t& recipient,
                     const tender::schema::amount_t& amount) override;

  bool transfer_all(const tender::schema::address_t& spender,
                    const std::vector<transfer_leg_t>& legs) override;

  uint8_t decimals(const tender::schema::address_t& token) const override;

 private:
  using balance_key_t =
      std::tuple<tender::schema::address_t, tender::schema::address_t>;
  using allowance_key_t = std::tuple<tender::schema::address_t,
                                     tender::schema::address_t,
                                     tender::schema::address_t>;

  struct book_t final {
    std::map<balance_key_t, tender::schema::amount_t> balances;
    std::map<allowance_key_t, tender::schema::amount_t> allowances;
  };

  static bool apply(book_t& book,
                    const tender::schema::address_t& spender,
                    const transfer_leg_t& leg);

  mutable std::mutex mutex_;
  book_t book_;
  std::map<tender::schema::address_t, uint8_t> decimals_;
};

}  // namespace tender::ledger
