#pragma once
#include <tender/schema/bid.hpp>
#include <tender/schema/bid_violation.hpp>
#include <tender/schema/offer.hpp>
#include <tender/schema/operation_result.hpp>
#include <tender/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace tender::execution {

/// One slot per rule; a bid can fail each rule at most once.
inline constexpr std::size_t kMaxBidViolations = 7;

/// Fixed-capacity, insertion-ordered list of violations. Appending past
/// capacity is an invariant breach and terminates the process.
class violation_list final {
 public:
  void append(tender::schema::bid_violation violation);

  std::size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }
  std::vector<tender::schema::bid_violation> to_vector() const;

 private:
  std::array<tender::schema::bid_violation, kMaxBidViolations> items_{};
  std::size_t size_{};
};

/// Everything the rules need beyond the offer and the bid itself. The
/// engine gathers these from the nonce ledger, the delegation registry and
/// the token ledger.
struct bid_facts_t final {
  // Address recovered against the signer's current nonce, std::nullopt when
  // the signature is malformed.
  std::optional<tender::schema::address_t> recovered_signer;
  bool authorized_signer{};
  tender::schema::amount_t bidder_allowance{};
  tender::schema::amount_t seller_allowance{};
};

/// `sell_amount * 10^decimals / bid_amount >= min_price`, evaluated without
/// intermediate overflow. A zero `bid_amount` never meets the minimum.
bool meets_min_price(const tender::schema::amount_t& sell_amount,
                     const tender::schema::amount_t& bid_amount,
                     uint8_t offer_token_decimals,
                     const tender::schema::amount_t& min_price);

/// Run every rule against `bid` in a fixed order and collect the failures.
/// Pure: the same inputs always produce the same result.
tender::schema::check_result_t check_bid(const tender::schema::offer_t& offer,
                                         const tender::schema::bid_t& bid,
                                         const bid_facts_t& facts);

}  // namespace tender::execution
