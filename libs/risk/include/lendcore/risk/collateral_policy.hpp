#pragma once

#include <cstdint>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace risk {

struct PolicyCheck {
  bool ok{false};
  common::Amount required{0};   // collateral the post-state must hold, USD
  common::Amount available{0};  // collateral the post-state would hold, USD
};

// Minimum collateralization. All inputs and outputs are USD aggregates.
class CollateralPolicy {
 public:
  static constexpr std::uint32_t kDefaultRatioPercent = 150;

  explicit CollateralPolicy(std::uint32_t ratio_percent = kDefaultRatioPercent);

  [[nodiscard]] std::uint32_t ratio_percent() const noexcept { return ratio_percent_; }

  // borrowed * ratio / 100, truncated toward zero.
  [[nodiscard]] common::Amount required_collateral(const common::Amount& borrowed_usd) const;

  [[nodiscard]] PolicyCheck check_position(const common::Amount& collateral_usd,
                                           const common::Amount& borrowed_usd) const;
  [[nodiscard]] PolicyCheck check_borrow(const common::Amount& collateral_usd,
                                         const common::Amount& borrowed_usd,
                                         const common::Amount& delta_usd) const;
  [[nodiscard]] PolicyCheck check_collateral_deposit(const common::Amount& collateral_usd,
                                                     const common::Amount& borrowed_usd,
                                                     const common::Amount& delta_usd) const;
  [[nodiscard]] PolicyCheck check_withdrawal(const common::Amount& collateral_usd,
                                             const common::Amount& borrowed_usd,
                                             const common::Amount& delta_usd) const;

 private:
  std::uint32_t ratio_percent_;
};

}  // namespace risk
}  // namespace lendcore
