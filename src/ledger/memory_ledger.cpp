#include <spdlog/spdlog.h>
#include <tender/ledger/memory_ledger.hpp>
#include <utility>

using namespace tender::schema;

namespace tender::ledger {

void memory_ledger::mint(const address_t& token,
                         const address_t& owner,
                         const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  book_.balances[balance_key_t{token, owner}] += amount;
}

void memory_ledger::approve(const address_t& token,
                            const address_t& owner,
                            const address_t& spender,
                            const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  book_.allowances[allowance_key_t{token, owner, spender}] = amount;
}

void memory_ledger::set_decimals(const address_t& token,
                                 const uint8_t decimals) {
  auto lock = std::scoped_lock{mutex_};
  decimals_[token] = decimals;
}

amount_t memory_ledger::balance_of(const address_t& token,
                                   const address_t& owner) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = book_.balances.find(balance_key_t{token, owner});
  return it == std::end(book_.balances) ? amount_t{} : it->second;
}

amount_t memory_ledger::allowance(const address_t& token,
                                  const address_t& owner,
                                  const address_t& spender) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = book_.allowances.find(allowance_key_t{token, owner, spender});
  return it == std::end(book_.allowances) ? amount_t{} : it->second;
}

bool memory_ledger::transfer_from(const address_t& token,
                                  const address_t& spender,
                                  const address_t& owner,
                                  const address_t& recipient,
                                  const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  return apply(book_, spender,
               transfer_leg_t{.token = token,
                              .owner = owner,
                              .recipient = recipient,
                              .amount = amount});
}

bool memory_ledger::transfer_all(const address_t& spender,
                                 const std::vector<transfer_leg_t>& legs) {
  auto lock = std::scoped_lock{mutex_};
  auto staged = book_;
  for (const auto& leg : legs) {
    if (!apply(staged, spender, leg)) {
      spdlog::warn("Transfer of {} {} from {} to {} failed", leg.amount.str(),
                   to_string(leg.token), to_string(leg.owner),
                   to_string(leg.recipient));
      return false;
    }
  }
  book_ = std::move(staged);
  return true;
}

uint8_t memory_ledger::decimals(const address_t& token) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = decimals_.find(token);
  return it == std::end(decimals_) ? kDefaultDecimals : it->second;
}

bool memory_ledger::apply(book_t& book,
                          const address_t& spender,
                          const transfer_leg_t& leg) {
  auto& allowance =
      book.allowances[allowance_key_t{leg.token, leg.owner, spender}];
  auto& from = book.balances[balance_key_t{leg.token, leg.owner}];
  if (allowance < leg.amount || from < leg.amount) {
    return false;
  }
  allowance -= leg.amount;
  from -= leg.amount;
  book.balances[balance_key_t{leg.token, leg.recipient}] += leg.amount;
  return true;
}

}  // namespace tender::ledger
