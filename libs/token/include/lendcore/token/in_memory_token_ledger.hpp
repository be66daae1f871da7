#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "lendcore/token/token_ledger.hpp"

namespace lendcore {
namespace token {

struct TokenMetadata {
  std::string name{};
  std::string symbol{};
  std::uint8_t decimals{8};
};

// In-process DIP-20 style token. `operator_id` is the principal that calls
// transfer_from on behalf of owners, so owners must approve it first.
class InMemoryTokenLedger : public TokenLedger {
 public:
  InMemoryTokenLedger(TokenMetadata metadata, common::UserId operator_id);

  [[nodiscard]] const TokenMetadata& metadata() const noexcept { return metadata_; }
  [[nodiscard]] const common::UserId& operator_id() const noexcept { return operator_; }

  void approve(const common::UserId& owner, const common::UserId& spender, common::Amount amount);
  [[nodiscard]] common::Amount allowance(const common::UserId& owner, const common::UserId& spender) const;
  common::CallResult transfer(const common::UserId& from, const common::UserId& to, const common::Amount& amount);

  common::CallResult transfer_from(const common::UserId& from,
                                   const common::UserId& to,
                                   const common::Amount& amount) override;
  common::CallResult mint(const common::UserId& to, const common::Amount& amount) override;
  [[nodiscard]] common::Amount balance_of(const common::UserId& owner) const override;
  [[nodiscard]] common::Amount total_supply() const;

 private:
  TokenMetadata metadata_;
  common::UserId operator_;

  mutable std::mutex mutex_;
  common::Amount total_supply_{0};
  std::map<common::UserId, common::Amount> balances_{};
  std::map<std::pair<common::UserId, common::UserId>, common::Amount> allowances_{};

  common::Amount balance_locked(const common::UserId& owner) const;
  void move_locked(const common::UserId& from, const common::UserId& to, const common::Amount& amount);
};

}  // namespace token
}  // namespace lendcore
