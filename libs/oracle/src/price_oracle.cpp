#include "lendcore/oracle/price_oracle.hpp"

#include <utility>

namespace lendcore {
namespace oracle {

namespace {
const common::Amount kDefaultUnitPrice{1};
}

StaticPriceOracle::StaticPriceOracle(std::unordered_map<common::TokenId, common::Amount> prices)
    : prices_(std::move(prices)) {}

void StaticPriceOracle::set_price(const common::TokenId& token, common::Amount price) {
  std::scoped_lock lock(mutex_);
  prices_[token] = std::move(price);
}

common::Amount StaticPriceOracle::unit_price(const common::TokenId& token) const {
  std::scoped_lock lock(mutex_);
  if (auto it = prices_.find(token); it != prices_.end()) {
    return it->second;
  }
  return kDefaultUnitPrice;
}

common::Amount usd_value(const PriceOracle& oracle,
                         const common::TokenId& token,
                         const common::Amount& amount) {
  return amount * oracle.unit_price(token);
}

common::Amount aggregate_usd(const PriceOracle& oracle,
                             const std::map<common::TokenId, common::Amount>& position) {
  common::Amount total{0};
  for (const auto& [token, amount] : position) {
    total += usd_value(oracle, token, amount);
  }
  return total;
}

}  // namespace oracle
}  // namespace lendcore
