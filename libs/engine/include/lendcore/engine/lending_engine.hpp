#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lendcore/common/logging.hpp"
#include "lendcore/common/types.hpp"
#include "lendcore/crowdfund/crowdfund_pool.hpp"
#include "lendcore/ledger/account_store.hpp"
#include "lendcore/ledger/mint_log.hpp"
#include "lendcore/ledger/token_registry.hpp"
#include "lendcore/oracle/price_oracle.hpp"
#include "lendcore/risk/collateral_policy.hpp"
#include "lendcore/risk/risk_gate.hpp"
#include "lendcore/telemetry/metrics.hpp"
#include "lendcore/token/token_ledger.hpp"

namespace lendcore {
namespace engine {

enum class OpKind : std::uint8_t {
  kSignup,
  kDeposit,
  kDepositCollateral,
  kBorrow,
  kRepay,
  kWithdrawCollateral,
  kContribute,
};

// Pending -> Validated -> (Suspended) -> Committed | Reverted | Rejected
enum class OpState : std::uint8_t {
  kPending,
  kValidated,
  kSuspended,
  kCommitted,
  kReverted,
  kRejected,
};

enum class ErrorKind : std::uint8_t {
  kNone,
  kPolicyViolation,
  kExternalCallFailure,
  kNotFound,
  kRiskRejected,
};

enum RejectCode : std::uint16_t {
  kRejectNone = 0,
  kRejectUnknownAccount = 3001,
  kRejectUnknownToken = 3002,
  kRejectInvalidAmount = 3003,
  kRejectInsufficientCollateral = 3004,
  kRejectInsufficientBalance = 3005,
  kRejectExceedsBorrowed = 3006,
  kRejectAlreadySignedUp = 3007,
  kRejectCollateralBreach = 3008,
  kRejectTransferFailed = 3102,
  kRejectMintFailed = 3103,
  kRejectHighRisk = 3201,
};

[[nodiscard]] std::string_view op_name(OpKind kind) noexcept;
[[nodiscard]] std::string_view state_name(OpState state) noexcept;
[[nodiscard]] std::string_view error_name(ErrorKind error) noexcept;

struct OpResult {
  OpKind kind{OpKind::kSignup};
  OpState state{OpState::kPending};
  ErrorKind error{ErrorKind::kNone};
  std::uint16_t reject_code{kRejectNone};
  std::string message{};
  std::optional<risk::Verdict> verdict{};

  [[nodiscard]] bool ok() const noexcept { return state == OpState::kCommitted; }
};

struct UsdPosition {
  common::Amount collateral{0};
  common::Amount borrowed{0};
  common::Amount deposits{0};
  common::Amount required_collateral{0};
};

// Collaborators shared with the rest of the process. All must outlive the engine.
struct EngineServices {
  const oracle::PriceOracle& prices;
  risk::RiskGate& risk_gate;
  ledger::TokenRegistry& tokens;
  token::TokenLedgerDirectory& token_ledgers;
  ledger::MintLog& mint_log;
  crowdfund::CrowdfundPool& crowdfund;
};

struct EngineConfig {
  common::UserId custody_account{"lendcore-pool"};
  common::Amount default_credit_score{700};
  std::uint32_t collateral_ratio_percent{risk::CollateralPolicy::kDefaultRatioPercent};
};

// Owns the account store and serializes access to it with a single mutex.
//
// Risk-gated operations (deposit_collateral, borrow) commit their delta, drop
// the lock for the risk call, then re-lock and revert on a high-risk verdict.
// The tentative value is visible to everyone in between and other operations
// may validate against it. No lock is ever held across an external call, and
// the log handler and metrics are only invoked with the lock released.
class LendingEngine {
 public:
  LendingEngine(EngineServices services,
                EngineConfig config = EngineConfig{},
                telemetry::Metrics* metrics = nullptr,
                common::LogHandler log = common::LogHandler{});

  LendingEngine(const LendingEngine&) = delete;
  LendingEngine& operator=(const LendingEngine&) = delete;

  // Administration
  void set_risk_service(common::Address address);
  bool register_token(const common::TokenId& token, common::Address ledger_address);

  // Mutating operations
  OpResult signup(const common::UserId& user, std::string username);
  OpResult deposit(const common::UserId& user, const common::TokenId& token, const common::Amount& amount);
  OpResult deposit_collateral(const common::UserId& user, const common::TokenId& token, const common::Amount& amount);
  OpResult borrow(const common::UserId& user, const common::TokenId& token, const common::Amount& amount);
  OpResult repay(const common::UserId& user, const common::TokenId& token, const common::Amount& amount);
  OpResult withdraw_collateral(const common::UserId& user, const common::TokenId& token, const common::Amount& amount);
  OpResult contribute(const common::UserId& user, const common::TokenId& token, const common::Amount& amount);

  // Reads. Every read returns a copy taken under the ledger lock.
  [[nodiscard]] std::vector<common::UserId> list_users() const;
  [[nodiscard]] std::optional<std::string> username(const common::UserId& user) const;
  [[nodiscard]] std::optional<ledger::Account> account(const common::UserId& user) const;
  [[nodiscard]] common::Amount balance(const common::UserId& user, const common::TokenId& token) const;
  [[nodiscard]] common::Amount collateral(const common::UserId& user, const common::TokenId& token) const;
  [[nodiscard]] common::Amount borrowed(const common::UserId& user, const common::TokenId& token) const;
  [[nodiscard]] std::optional<UsdPosition> usd_position(const common::UserId& user) const;
  [[nodiscard]] common::Amount total_supply(const common::TokenId& token) const;
  [[nodiscard]] std::vector<ledger::MintEntry> mint_log() const;
  [[nodiscard]] std::vector<ledger::MintEntry> mint_log(const common::UserId& user) const;
  [[nodiscard]] std::vector<common::TokenId> supported_tokens() const;
  [[nodiscard]] std::optional<common::Address> token_ledger_address(const common::TokenId& token) const;
  [[nodiscard]] std::string_view version() const noexcept { return common::kVersion; }
  [[nodiscard]] const risk::CollateralPolicy& policy() const noexcept { return policy_; }

 private:
  EngineServices services_;
  EngineConfig config_;
  telemetry::Metrics* metrics_;
  common::LogHandler log_;
  risk::CollateralPolicy policy_;

  mutable std::mutex mutex_;
  ledger::AccountStore accounts_;

  using TokenCall = std::function<common::CallResult(token::TokenLedger&)>;

  bool admit(OpResult& result, const common::TokenId& token, const common::Amount& amount) const;
  OpResult risk_gated(OpKind kind,
                      const common::UserId& user,
                      const common::TokenId& token,
                      const common::Amount& amount);

  UsdPosition position_locked(const ledger::Account& account) const;
  risk::RiskInputs risk_inputs(const common::UserId& user) const;
  void credit_locked(const common::UserId& user,
                     const common::TokenId& token,
                     ledger::Field field,
                     const common::Amount& amount);
  void withdraw_locked(OpResult& result,
                       const common::UserId& user,
                       const common::TokenId& token,
                       const common::Amount& amount);
  // Removes up to `amount`; returns the part already consumed by others.
  common::Amount revert_locked(const common::UserId& user,
                               const common::TokenId& token,
                               ledger::Field field,
                               const common::Amount& amount);
  void note_shortfall(const common::UserId& user, const common::TokenId& token,
                      const common::Amount& shortfall) const;
  common::CallResult call_token(const common::TokenId& token, const TokenCall& call);

  OpResult& reject(OpResult& result, ErrorKind error, std::uint16_t code, std::string message) const;
  OpResult& finish(OpResult& result, const common::UserId& user, const common::TokenId& token,
                   const common::Amount& amount) const;
};

}  // namespace engine
}  // namespace lendcore
