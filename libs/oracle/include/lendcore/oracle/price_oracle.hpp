#pragma once

#include <map>
#include <mutex>
#include <unordered_map>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace oracle {

class PriceOracle {
 public:
  virtual ~PriceOracle() = default;

  // USD price of one unit of `token`.
  [[nodiscard]] virtual common::Amount unit_price(const common::TokenId& token) const = 0;
};

// Price table guarded by its own lock, so prices may change while the engine
// reads them. Tokens missing from the table price at 1.
class StaticPriceOracle : public PriceOracle {
 public:
  StaticPriceOracle() = default;
  explicit StaticPriceOracle(std::unordered_map<common::TokenId, common::Amount> prices);

  void set_price(const common::TokenId& token, common::Amount price);
  [[nodiscard]] common::Amount unit_price(const common::TokenId& token) const override;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<common::TokenId, common::Amount> prices_{};
};

[[nodiscard]] common::Amount usd_value(const PriceOracle& oracle,
                                       const common::TokenId& token,
                                       const common::Amount& amount);

// Sum of amount * unit_price over every token in the position.
[[nodiscard]] common::Amount aggregate_usd(const PriceOracle& oracle,
                                           const std::map<common::TokenId, common::Amount>& position);

}  // namespace oracle
}  // namespace lendcore
