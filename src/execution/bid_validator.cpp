#include <boost/multiprecision/cpp_int.hpp>
#include <tender/common/critical.hpp>
#include <tender/execution/bid_validator.hpp>

using namespace tender::schema;

namespace tender::execution {

void violation_list::append(const bid_violation violation) {
  if (size_ >= items_.size()) {
    tender::common::critical("bid violation list overflow");
  }
  items_[size_++] = violation;
}

std::vector<bid_violation> violation_list::to_vector() const {
  return std::vector<bid_violation>{std::begin(items_),
                                    std::begin(items_) + size_};
}

bool meets_min_price(const amount_t& sell_amount,
                     const amount_t& bid_amount,
                     const uint8_t offer_token_decimals,
                     const amount_t& min_price) {
  using boost::multiprecision::cpp_int;
  if (bid_amount == 0) {
    return false;
  }
  auto price = cpp_int{sell_amount};
  price *= boost::multiprecision::pow(cpp_int{10}, offer_token_decimals);
  price /= cpp_int{bid_amount};
  return price >= cpp_int{min_price};
}

check_result_t check_bid(const offer_t& offer,
                         const bid_t& bid,
                         const bid_facts_t& facts) {
  auto violations = violation_list{};

  if (!facts.recovered_signer ||
      *facts.recovered_signer != bid.signer_address) {
    violations.append(bid_violation::signature_mismatched);
  }
  if (!facts.authorized_signer) {
    violations.append(bid_violation::invalid_signer_for_bidder);
  }
  if (bid.bid_amount < offer.min_bid_size) {
    violations.append(bid_violation::bid_too_small);
  }
  if (bid.bid_amount > offer.total_size) {
    violations.append(bid_violation::bid_exceed_total_size);
  }
  if (!meets_min_price(bid.sell_amount, bid.bid_amount,
                       offer.offer_token_decimals, offer.min_price)) {
    violations.append(bid_violation::price_too_low);
  }
  if (facts.bidder_allowance < bid.sell_amount) {
    violations.append(bid_violation::bidder_allowance_low);
  }
  if (facts.seller_allowance < bid.bid_amount) {
    violations.append(bid_violation::seller_allowance_low);
  }

  auto result = check_result_t{};
  result.error_count = violations.size();
  result.violations = violations.to_vector();
  if (!violations.empty()) {
    result.log = "bid failed pre-flight checks";
    result.codespace = "tender.query";
  }
  return result;
}

}  // namespace tender::execution
