#include "lendcore/ledger/token_registry.hpp"

namespace lendcore {
namespace ledger {

bool TokenRegistry::register_token(const common::TokenId& token, common::Address ledger_address) {
  std::scoped_lock lock(mutex_);
  auto [it, inserted] = addresses_.try_emplace(token, ledger_address);
  if (!inserted) {
    it->second = std::move(ledger_address);
    return false;
  }
  order_.push_back(token);
  return true;
}

bool TokenRegistry::is_supported(const common::TokenId& token) const {
  std::scoped_lock lock(mutex_);
  return addresses_.find(token) != addresses_.end();
}

std::optional<common::Address> TokenRegistry::ledger_address(const common::TokenId& token) const {
  std::scoped_lock lock(mutex_);
  if (auto it = addresses_.find(token); it != addresses_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::vector<common::TokenId> TokenRegistry::tokens() const {
  std::scoped_lock lock(mutex_);
  return order_;
}

}  // namespace ledger
}  // namespace lendcore
