#pragma once

#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace ledger {

// Supported tokens in registration order, each bound to the address of its
// external token ledger. Entries are only ever added or re-pointed.
class TokenRegistry {
 public:
  // Returns true when the token was newly added, false when only its address changed.
  bool register_token(const common::TokenId& token, common::Address ledger_address);

  [[nodiscard]] bool is_supported(const common::TokenId& token) const;
  [[nodiscard]] std::optional<common::Address> ledger_address(const common::TokenId& token) const;
  [[nodiscard]] std::vector<common::TokenId> tokens() const;

 private:
  mutable std::mutex mutex_;
  std::vector<common::TokenId> order_{};
  std::unordered_map<common::TokenId, common::Address> addresses_{};
};

}  // namespace ledger
}  // namespace lendcore
