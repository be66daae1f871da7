#include "lendcore/risk/collateral_policy.hpp"

#include <stdexcept>

namespace lendcore {
namespace risk {

namespace {
constexpr std::uint32_t kPercentDenominator = 100;
}

CollateralPolicy::CollateralPolicy(std::uint32_t ratio_percent) : ratio_percent_(ratio_percent) {
  if (ratio_percent_ < kPercentDenominator) {
    throw std::invalid_argument("collateral ratio must be at least 100%");
  }
}

common::Amount CollateralPolicy::required_collateral(const common::Amount& borrowed_usd) const {
  common::Amount scaled = borrowed_usd * ratio_percent_;
  return scaled / kPercentDenominator;
}

PolicyCheck CollateralPolicy::check_position(const common::Amount& collateral_usd,
                                             const common::Amount& borrowed_usd) const {
  PolicyCheck check;
  check.required = required_collateral(borrowed_usd);
  check.available = collateral_usd;
  check.ok = check.available >= check.required;
  return check;
}

PolicyCheck CollateralPolicy::check_borrow(const common::Amount& collateral_usd,
                                           const common::Amount& borrowed_usd,
                                           const common::Amount& delta_usd) const {
  const common::Amount projected_borrowed = borrowed_usd + delta_usd;
  return check_position(collateral_usd, projected_borrowed);
}

PolicyCheck CollateralPolicy::check_collateral_deposit(const common::Amount& collateral_usd,
                                                       const common::Amount& borrowed_usd,
                                                       const common::Amount& delta_usd) const {
  const common::Amount projected_collateral = collateral_usd + delta_usd;
  return check_position(projected_collateral, borrowed_usd);
}

PolicyCheck CollateralPolicy::check_withdrawal(const common::Amount& collateral_usd,
                                               const common::Amount& borrowed_usd,
                                               const common::Amount& delta_usd) const {
  if (delta_usd > collateral_usd) {
    PolicyCheck check;
    check.required = required_collateral(borrowed_usd);
    check.available = 0;
    check.ok = false;
    return check;
  }
  const common::Amount remaining = collateral_usd - delta_usd;
  return check_position(remaining, borrowed_usd);
}

}  // namespace risk
}  // namespace lendcore
