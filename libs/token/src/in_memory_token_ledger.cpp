#include "lendcore/token/in_memory_token_ledger.hpp"

namespace lendcore {
namespace token {

InMemoryTokenLedger::InMemoryTokenLedger(TokenMetadata metadata, common::UserId operator_id)
    : metadata_(std::move(metadata)), operator_(std::move(operator_id)) {}

void InMemoryTokenLedger::approve(const common::UserId& owner,
                                  const common::UserId& spender,
                                  common::Amount amount) {
  std::scoped_lock lock(mutex_);
  allowances_[{owner, spender}] = std::move(amount);
}

common::Amount InMemoryTokenLedger::allowance(const common::UserId& owner,
                                              const common::UserId& spender) const {
  std::scoped_lock lock(mutex_);
  if (auto it = allowances_.find({owner, spender}); it != allowances_.end()) {
    return it->second;
  }
  return 0;
}

common::CallResult InMemoryTokenLedger::transfer(const common::UserId& from,
                                                 const common::UserId& to,
                                                 const common::Amount& amount) {
  std::scoped_lock lock(mutex_);
  if (balance_locked(from) < amount) {
    return common::CallResult::failure("insufficient balance");
  }
  move_locked(from, to, amount);
  return common::CallResult::success();
}

common::CallResult InMemoryTokenLedger::transfer_from(const common::UserId& from,
                                                      const common::UserId& to,
                                                      const common::Amount& amount) {
  std::scoped_lock lock(mutex_);
  auto allowance_it = allowances_.find({from, operator_});
  if (allowance_it == allowances_.end() || allowance_it->second < amount) {
    return common::CallResult::failure("insufficient allowance");
  }
  if (balance_locked(from) < amount) {
    return common::CallResult::failure("insufficient balance");
  }
  move_locked(from, to, amount);
  allowance_it->second -= amount;
  return common::CallResult::success();
}

common::CallResult InMemoryTokenLedger::mint(const common::UserId& to, const common::Amount& amount) {
  std::scoped_lock lock(mutex_);
  balances_[to] += amount;
  total_supply_ += amount;
  return common::CallResult::success();
}

common::Amount InMemoryTokenLedger::balance_of(const common::UserId& owner) const {
  std::scoped_lock lock(mutex_);
  return balance_locked(owner);
}

common::Amount InMemoryTokenLedger::total_supply() const {
  std::scoped_lock lock(mutex_);
  return total_supply_;
}

common::Amount InMemoryTokenLedger::balance_locked(const common::UserId& owner) const {
  if (auto it = balances_.find(owner); it != balances_.end()) {
    return it->second;
  }
  return 0;
}

void InMemoryTokenLedger::move_locked(const common::UserId& from,
                                      const common::UserId& to,
                                      const common::Amount& amount) {
  balances_[from] -= amount;
  balances_[to] += amount;
}

}  // namespace token
}  // namespace lendcore
