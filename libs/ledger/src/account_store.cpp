#include "lendcore/ledger/account_store.hpp"

#include <algorithm>

namespace lendcore {
namespace ledger {

const TokenAmounts& Account::field(Field f) const noexcept {
  switch (f) {
    case Field::kBalance:
      return balances;
    case Field::kCollateral:
      return collateral;
    case Field::kBorrowed:
      return borrowed;
  }
  return balances;
}

TokenAmounts& Account::field(Field f) noexcept {
  return const_cast<TokenAmounts&>(static_cast<const Account&>(*this).field(f));
}

common::Amount Account::amount(Field f, const common::TokenId& token) const {
  const auto& amounts = field(f);
  if (auto it = amounts.find(token); it != amounts.end()) {
    return it->second;
  }
  return 0;
}

AccountStore::AccountStore(common::Amount default_credit_score)
    : default_credit_score_(std::move(default_credit_score)) {}

Account& AccountStore::get_or_create(const common::UserId& user) {
  auto [it, inserted] = accounts_.try_emplace(user);
  if (inserted) {
    it->second.credit_score = default_credit_score_;
  }
  return it->second;
}

bool AccountStore::create(const common::UserId& user, std::string username) {
  if (contains(user)) {
    return false;
  }
  get_or_create(user).username = std::move(username);
  return true;
}

bool AccountStore::contains(const common::UserId& user) const {
  return accounts_.find(user) != accounts_.end();
}

Account* AccountStore::find(const common::UserId& user) {
  if (auto it = accounts_.find(user); it != accounts_.end()) {
    return &it->second;
  }
  return nullptr;
}

const Account* AccountStore::find(const common::UserId& user) const {
  if (auto it = accounts_.find(user); it != accounts_.end()) {
    return &it->second;
  }
  return nullptr;
}

common::Amount AccountStore::read(const common::UserId& user,
                                  const common::TokenId& token,
                                  Field field) const {
  const auto* account = find(user);
  if (!account) {
    return 0;
  }
  return account->amount(field, token);
}

bool AccountStore::adjust(const common::UserId& user,
                          const common::TokenId& token,
                          Field field,
                          const common::Amount& delta) {
  auto* account = find(user);
  if (!account) {
    return false;
  }
  auto& amounts = account->field(field);
  const common::Amount current = account->amount(field, token);
  common::Amount next = current + delta;
  if (next < 0) {
    return false;
  }
  amounts[token] = std::move(next);
  return true;
}

std::vector<common::UserId> AccountStore::users() const {
  std::vector<common::UserId> out;
  out.reserve(accounts_.size());
  for (const auto& [user, account] : accounts_) {
    out.push_back(user);
  }
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace ledger
}  // namespace lendcore
