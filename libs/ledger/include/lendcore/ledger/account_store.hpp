#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace ledger {

enum class Field : std::uint8_t {
  kBalance,
  kCollateral,
  kBorrowed,
};

using TokenAmounts = std::map<common::TokenId, common::Amount>;

struct Account {
  TokenAmounts balances{};
  TokenAmounts collateral{};
  TokenAmounts borrowed{};
  common::Amount credit_score{0};
  std::optional<std::string> risk_advice{};
  std::optional<std::string> username{};

  [[nodiscard]] const TokenAmounts& field(Field f) const noexcept;
  [[nodiscard]] TokenAmounts& field(Field f) noexcept;
  [[nodiscard]] common::Amount amount(Field f, const common::TokenId& token) const;
};

// Per-user positions keyed by (user, token). Not synchronized: the owning
// engine serializes access.
class AccountStore {
 public:
  explicit AccountStore(common::Amount default_credit_score = 700);

  Account& get_or_create(const common::UserId& user);
  bool create(const common::UserId& user, std::string username);

  [[nodiscard]] bool contains(const common::UserId& user) const;
  [[nodiscard]] Account* find(const common::UserId& user);
  [[nodiscard]] const Account* find(const common::UserId& user) const;

  [[nodiscard]] common::Amount read(const common::UserId& user,
                                    const common::TokenId& token,
                                    Field field) const;

  // Applies a signed delta. Returns false, leaving the account untouched, when
  // the user is unknown or the result would be negative.
  bool adjust(const common::UserId& user,
              const common::TokenId& token,
              Field field,
              const common::Amount& delta);

  [[nodiscard]] std::vector<common::UserId> users() const;
  [[nodiscard]] std::size_t size() const noexcept { return accounts_.size(); }
  [[nodiscard]] const common::Amount& default_credit_score() const noexcept { return default_credit_score_; }

 private:
  common::Amount default_credit_score_;
  std::unordered_map<common::UserId, Account> accounts_{};
};

}  // namespace ledger
}  // namespace lendcore
