#include "lendcore/crowdfund/crowdfund_pool.hpp"

namespace lendcore {
namespace crowdfund {

void CrowdfundPool::record(const common::UserId& user,
                           const common::TokenId& token,
                           const common::Amount& amount) {
  std::scoped_lock lock(mutex_);
  funds_[token] += amount;
  contributors_[user][token] += amount;
}

common::Amount CrowdfundPool::funds(const common::TokenId& token) const {
  std::scoped_lock lock(mutex_);
  if (auto it = funds_.find(token); it != funds_.end()) {
    return it->second;
  }
  return 0;
}

Contributions CrowdfundPool::all_funds() const {
  std::scoped_lock lock(mutex_);
  return funds_;
}

common::Amount CrowdfundPool::contribution(const common::UserId& user, const common::TokenId& token) const {
  std::scoped_lock lock(mutex_);
  auto user_it = contributors_.find(user);
  if (user_it == contributors_.end()) {
    return 0;
  }
  if (auto it = user_it->second.find(token); it != user_it->second.end()) {
    return it->second;
  }
  return 0;
}

std::map<common::UserId, Contributions> CrowdfundPool::contributors() const {
  std::scoped_lock lock(mutex_);
  return contributors_;
}

}  // namespace crowdfund
}  // namespace lendcore
