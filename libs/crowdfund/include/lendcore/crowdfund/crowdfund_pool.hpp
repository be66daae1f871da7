#pragma once

#include <map>
#include <mutex>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace crowdfund {

using Contributions = std::map<common::TokenId, common::Amount>;

// Contribution totals, kept apart from lending accounts.
class CrowdfundPool {
 public:
  // Adds to the token total and the user's contribution in one step.
  void record(const common::UserId& user, const common::TokenId& token, const common::Amount& amount);

  [[nodiscard]] common::Amount funds(const common::TokenId& token) const;
  [[nodiscard]] Contributions all_funds() const;
  [[nodiscard]] common::Amount contribution(const common::UserId& user, const common::TokenId& token) const;
  [[nodiscard]] std::map<common::UserId, Contributions> contributors() const;

 private:
  mutable std::mutex mutex_;
  Contributions funds_{};
  std::map<common::UserId, Contributions> contributors_{};
};

}  // namespace crowdfund
}  // namespace lendcore
