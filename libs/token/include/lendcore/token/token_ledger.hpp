#pragma once

#include "lendcore/common/endpoint_directory.hpp"
#include "lendcore/common/types.hpp"

namespace lendcore {
namespace token {

// Authoritative token contract for one token. A failed call has no effect.
class TokenLedger {
 public:
  virtual ~TokenLedger() = default;

  virtual common::CallResult transfer_from(const common::UserId& from,
                                           const common::UserId& to,
                                           const common::Amount& amount) = 0;
  virtual common::CallResult mint(const common::UserId& to, const common::Amount& amount) = 0;
  [[nodiscard]] virtual common::Amount balance_of(const common::UserId& owner) const = 0;
};

using TokenLedgerDirectory = common::EndpointDirectory<TokenLedger>;

}  // namespace token
}  // namespace lendcore
