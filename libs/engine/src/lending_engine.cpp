#include "lendcore/engine/lending_engine.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace lendcore {
namespace engine {

namespace {

constexpr std::string_view kAdviceBorrowShortfall = "Insufficient collateral to borrow requested amount";
constexpr std::string_view kAdviceDepositShortfall = "Collateral insufficient for current borrowed amount";
constexpr std::string_view kAdviceWithdrawExceeds = "Insufficient collateral to withdraw";
constexpr std::string_view kAdviceWithdrawBreach = "Cannot withdraw: would breach minimum collateral";
constexpr std::string_view kAdviceWithdrawn = "Collateral withdrawn successfully";

std::string describe(const risk::PolicyCheck& check) {
  return "required " + common::to_string(check.required) + " USD, available " +
         common::to_string(check.available) + " USD";
}

}  // namespace

std::string_view op_name(OpKind kind) noexcept {
  switch (kind) {
    case OpKind::kSignup:
      return "signup";
    case OpKind::kDeposit:
      return "deposit";
    case OpKind::kDepositCollateral:
      return "deposit_collateral";
    case OpKind::kBorrow:
      return "borrow";
    case OpKind::kRepay:
      return "repay";
    case OpKind::kWithdrawCollateral:
      return "withdraw_collateral";
    case OpKind::kContribute:
      return "contribute";
  }
  return "unknown";
}

std::string_view state_name(OpState state) noexcept {
  switch (state) {
    case OpState::kPending:
      return "pending";
    case OpState::kValidated:
      return "validated";
    case OpState::kSuspended:
      return "suspended";
    case OpState::kCommitted:
      return "committed";
    case OpState::kReverted:
      return "reverted";
    case OpState::kRejected:
      return "rejected";
  }
  return "unknown";
}

std::string_view error_name(ErrorKind error) noexcept {
  switch (error) {
    case ErrorKind::kNone:
      return "none";
    case ErrorKind::kPolicyViolation:
      return "policy_violation";
    case ErrorKind::kExternalCallFailure:
      return "external_call_failure";
    case ErrorKind::kNotFound:
      return "not_found";
    case ErrorKind::kRiskRejected:
      return "risk_rejected";
  }
  return "unknown";
}

LendingEngine::LendingEngine(EngineServices services,
                             EngineConfig config,
                             telemetry::Metrics* metrics,
                             common::LogHandler log)
    : services_(services),
      config_(std::move(config)),
      metrics_(metrics),
      log_(std::move(log)),
      policy_(config_.collateral_ratio_percent),
      accounts_(config_.default_credit_score) {
  if (config_.custody_account.empty()) {
    throw std::invalid_argument("custody account must not be empty");
  }
}

void LendingEngine::set_risk_service(common::Address address) {
  common::log(log_, common::LogLevel::kInfo, "risk service set to " + address);
  services_.risk_gate.set_endpoint(std::move(address));
}

bool LendingEngine::register_token(const common::TokenId& token, common::Address ledger_address) {
  common::log(log_, common::LogLevel::kInfo, "token " + token + " -> " + ledger_address);
  return services_.tokens.register_token(token, std::move(ledger_address));
}

OpResult LendingEngine::signup(const common::UserId& user, std::string username) {
  OpResult result{.kind = OpKind::kSignup};
  {
    std::scoped_lock lock(mutex_);
    if (!accounts_.create(user, std::move(username))) {
      reject(result, ErrorKind::kPolicyViolation, kRejectAlreadySignedUp, "user already exists");
    } else {
      result.state = OpState::kCommitted;
    }
  }
  if (result.ok() && metrics_) {
    metrics_->increment(telemetry::Metric::kSignup);
  }
  return finish(result, user, {}, 0);
}

OpResult LendingEngine::deposit(const common::UserId& user,
                                const common::TokenId& token,
                                const common::Amount& amount) {
  OpResult result{.kind = OpKind::kDeposit};
  if (!admit(result, token, amount)) {
    return finish(result, user, token, amount);
  }
  {
    std::scoped_lock lock(mutex_);
    if (!accounts_.contains(user)) {
      reject(result, ErrorKind::kNotFound, kRejectUnknownAccount, "user not found");
    }
  }
  if (result.state == OpState::kRejected) {
    return finish(result, user, token, amount);
  }
  result.state = OpState::kValidated;

  const common::CallResult transferred = call_token(token, [&](token::TokenLedger& ledger) {
    return ledger.transfer_from(user, config_.custody_account, amount);
  });
  if (!transferred.ok()) {
    reject(result, ErrorKind::kExternalCallFailure, kRejectTransferFailed,
           "transfer to custody failed: " + transferred.reason);
    return finish(result, user, token, amount);
  }

  const common::CallResult minted = call_token(token, [&](token::TokenLedger& ledger) {
    return ledger.mint(user, amount);
  });
  if (!minted.ok()) {
    // The transfer already moved funds into custody; nothing gives them back.
    if (metrics_) {
      metrics_->increment(telemetry::Metric::kPartialDeposit);
    }
    common::log(log_, common::LogLevel::kError,
                "deposit " + user + " " + common::to_string(amount) + " " + token +
                    ": transferred to custody but mint failed (" + minted.reason + "), transfer not compensated");
    reject(result, ErrorKind::kExternalCallFailure, kRejectMintFailed,
           "mint failed after transfer: " + minted.reason);
    return finish(result, user, token, amount);
  }

  {
    std::scoped_lock lock(mutex_);
    credit_locked(user, token, ledger::Field::kBalance, amount);
  }
  services_.mint_log.append(user, token, amount);
  if (metrics_) {
    metrics_->increment(telemetry::Metric::kMint);
  }
  result.state = OpState::kCommitted;
  return finish(result, user, token, amount);
}

OpResult LendingEngine::deposit_collateral(const common::UserId& user,
                                           const common::TokenId& token,
                                           const common::Amount& amount) {
  return risk_gated(OpKind::kDepositCollateral, user, token, amount);
}

OpResult LendingEngine::borrow(const common::UserId& user,
                               const common::TokenId& token,
                               const common::Amount& amount) {
  return risk_gated(OpKind::kBorrow, user, token, amount);
}

OpResult LendingEngine::risk_gated(OpKind kind,
                                   const common::UserId& user,
                                   const common::TokenId& token,
                                   const common::Amount& amount) {
  OpResult result{.kind = kind};
  if (!admit(result, token, amount)) {
    return finish(result, user, token, amount);
  }
  const bool is_borrow = kind == OpKind::kBorrow;
  const ledger::Field field = is_borrow ? ledger::Field::kBorrowed : ledger::Field::kCollateral;

  // Phase 1: validate the tentative post-state and commit it.
  {
    std::scoped_lock lock(mutex_);
    if (auto* account = accounts_.find(user); !account) {
      reject(result, ErrorKind::kNotFound, kRejectUnknownAccount, "user not found");
    } else {
      const UsdPosition position = position_locked(*account);
      const common::Amount delta_usd = oracle::usd_value(services_.prices, token, amount);
      const risk::PolicyCheck check =
          is_borrow ? policy_.check_borrow(position.collateral, position.borrowed, delta_usd)
                    : policy_.check_collateral_deposit(position.collateral, position.borrowed, delta_usd);
      if (!check.ok) {
        const std::string_view advice = is_borrow ? kAdviceBorrowShortfall : kAdviceDepositShortfall;
        account->risk_advice = std::string(advice);
        reject(result, ErrorKind::kPolicyViolation, kRejectInsufficientCollateral,
               std::string(advice) + " (" + describe(check) + ")");
      } else {
        credit_locked(user, token, field, amount);
        result.state = OpState::kValidated;
      }
    }
  }
  if (result.state == OpState::kRejected) {
    return finish(result, user, token, amount);
  }

  // Phase 2: ask the risk gate without holding the lock.
  result.state = OpState::kSuspended;
  const risk::Assessment assessment = services_.risk_gate.evaluate(risk_inputs(user));
  result.verdict = assessment.verdict;

  // Phase 3: keep or revert the tentative delta.
  const bool high_risk = assessment.verdict == risk::Verdict::kHighRisk;
  common::Amount shortfall{0};
  {
    std::scoped_lock lock(mutex_);
    if (assessment.advice) {
      if (auto* account = accounts_.find(user)) {
        account->risk_advice = *assessment.advice;
      }
    }
    if (high_risk) {
      shortfall = revert_locked(user, token, field, amount);
    }
  }
  if (high_risk) {
    note_shortfall(user, token, shortfall);
    result.state = OpState::kReverted;
    result.error = ErrorKind::kRiskRejected;
    result.reject_code = kRejectHighRisk;
    result.message = assessment.advice.value_or("high risk");
    return finish(result, user, token, amount);
  }

  if (!is_borrow) {
    result.state = OpState::kCommitted;
    return finish(result, user, token, amount);
  }

  const common::CallResult minted = call_token(token, [&](token::TokenLedger& ledger) {
    return ledger.mint(user, amount);
  });
  if (!minted.ok()) {
    {
      std::scoped_lock lock(mutex_);
      shortfall = revert_locked(user, token, ledger::Field::kBorrowed, amount);
    }
    note_shortfall(user, token, shortfall);
    result.state = OpState::kReverted;
    result.error = ErrorKind::kExternalCallFailure;
    result.reject_code = kRejectMintFailed;
    result.message = "mint of borrowed funds failed: " + minted.reason;
    return finish(result, user, token, amount);
  }

  {
    std::scoped_lock lock(mutex_);
    credit_locked(user, token, ledger::Field::kBalance, amount);
  }
  services_.mint_log.append(user, token, amount);
  if (metrics_) {
    metrics_->increment(telemetry::Metric::kMint);
  }
  result.state = OpState::kCommitted;
  return finish(result, user, token, amount);
}

OpResult LendingEngine::repay(const common::UserId& user,
                              const common::TokenId& token,
                              const common::Amount& amount) {
  OpResult result{.kind = OpKind::kRepay};
  if (!admit(result, token, amount)) {
    return finish(result, user, token, amount);
  }

  {
    std::scoped_lock lock(mutex_);
    const auto* account = accounts_.find(user);
    if (!account) {
      reject(result, ErrorKind::kNotFound, kRejectUnknownAccount, "user not found");
    } else if (account->amount(ledger::Field::kBorrowed, token) < amount) {
      reject(result, ErrorKind::kPolicyViolation, kRejectExceedsBorrowed, "repay exceeds borrowed amount");
    } else if (account->amount(ledger::Field::kBalance, token) < amount) {
      reject(result, ErrorKind::kPolicyViolation, kRejectInsufficientBalance, "insufficient balance to repay");
    } else {
      result.state = OpState::kValidated;
      const common::Amount negated = -amount;
      if (!accounts_.adjust(user, token, ledger::Field::kBorrowed, negated) ||
          !accounts_.adjust(user, token, ledger::Field::kBalance, negated)) {
        throw std::logic_error("repay adjusted a validated account below zero");
      }
      result.state = OpState::kCommitted;
    }
  }
  return finish(result, user, token, amount);
}

OpResult LendingEngine::withdraw_collateral(const common::UserId& user,
                                            const common::TokenId& token,
                                            const common::Amount& amount) {
  OpResult result{.kind = OpKind::kWithdrawCollateral};
  if (!admit(result, token, amount)) {
    return finish(result, user, token, amount);
  }

  {
    std::scoped_lock lock(mutex_);
    withdraw_locked(result, user, token, amount);
  }
  return finish(result, user, token, amount);
}

void LendingEngine::withdraw_locked(OpResult& result,
                                    const common::UserId& user,
                                    const common::TokenId& token,
                                    const common::Amount& amount) {
  auto* account = accounts_.find(user);
  if (!account) {
    reject(result, ErrorKind::kNotFound, kRejectUnknownAccount, "user not found");
    return;
  }
  if (account->amount(ledger::Field::kCollateral, token) < amount) {
    account->risk_advice = std::string(kAdviceWithdrawExceeds);
    reject(result, ErrorKind::kPolicyViolation, kRejectInsufficientCollateral, std::string(kAdviceWithdrawExceeds));
    return;
  }

  const UsdPosition position = position_locked(*account);
  const risk::PolicyCheck check = policy_.check_withdrawal(
      position.collateral, position.borrowed, oracle::usd_value(services_.prices, token, amount));
  if (!check.ok) {
    account->risk_advice = std::string(kAdviceWithdrawBreach);
    reject(result, ErrorKind::kPolicyViolation, kRejectCollateralBreach,
           std::string(kAdviceWithdrawBreach) + " (" + describe(check) + ")");
    return;
  }
  result.state = OpState::kValidated;

  if (!accounts_.adjust(user, token, ledger::Field::kCollateral, -amount)) {
    throw std::logic_error("withdrawal adjusted a validated account below zero");
  }
  account->risk_advice = std::string(kAdviceWithdrawn);
  result.state = OpState::kCommitted;
}

OpResult LendingEngine::contribute(const common::UserId& user,
                                   const common::TokenId& token,
                                   const common::Amount& amount) {
  OpResult result{.kind = OpKind::kContribute};
  if (!admit(result, token, amount)) {
    return finish(result, user, token, amount);
  }
  result.state = OpState::kValidated;

  services_.crowdfund.record(user, token, amount);
  result.state = OpState::kCommitted;
  if (metrics_) {
    metrics_->increment(telemetry::Metric::kContribution);
  }

  const common::CallResult minted = call_token(token, [&](token::TokenLedger& ledger) {
    return ledger.mint(user, amount);
  });
  if (minted.ok()) {
    services_.mint_log.append(user, token, amount);
    if (metrics_) {
      metrics_->increment(telemetry::Metric::kMint);
    }
  } else {
    result.error = ErrorKind::kExternalCallFailure;
    result.reject_code = kRejectMintFailed;
    result.message = "contribution recorded but mint failed: " + minted.reason;
  }
  return finish(result, user, token, amount);
}

std::vector<common::UserId> LendingEngine::list_users() const {
  std::scoped_lock lock(mutex_);
  return accounts_.users();
}

std::optional<std::string> LendingEngine::username(const common::UserId& user) const {
  std::scoped_lock lock(mutex_);
  if (const auto* account = accounts_.find(user)) {
    return account->username;
  }
  return std::nullopt;
}

std::optional<ledger::Account> LendingEngine::account(const common::UserId& user) const {
  std::scoped_lock lock(mutex_);
  if (const auto* account = accounts_.find(user)) {
    return *account;
  }
  return std::nullopt;
}

common::Amount LendingEngine::balance(const common::UserId& user, const common::TokenId& token) const {
  std::scoped_lock lock(mutex_);
  return accounts_.read(user, token, ledger::Field::kBalance);
}

common::Amount LendingEngine::collateral(const common::UserId& user, const common::TokenId& token) const {
  std::scoped_lock lock(mutex_);
  return accounts_.read(user, token, ledger::Field::kCollateral);
}

common::Amount LendingEngine::borrowed(const common::UserId& user, const common::TokenId& token) const {
  std::scoped_lock lock(mutex_);
  return accounts_.read(user, token, ledger::Field::kBorrowed);
}

std::optional<UsdPosition> LendingEngine::usd_position(const common::UserId& user) const {
  std::scoped_lock lock(mutex_);
  if (const auto* account = accounts_.find(user)) {
    return position_locked(*account);
  }
  return std::nullopt;
}

common::Amount LendingEngine::total_supply(const common::TokenId& token) const {
  std::scoped_lock lock(mutex_);
  common::Amount total{0};
  for (const auto& user : accounts_.users()) {
    total += accounts_.read(user, token, ledger::Field::kBalance);
  }
  return total;
}

std::vector<ledger::MintEntry> LendingEngine::mint_log() const {
  return services_.mint_log.entries();
}

std::vector<ledger::MintEntry> LendingEngine::mint_log(const common::UserId& user) const {
  return services_.mint_log.entries_for(user);
}

std::vector<common::TokenId> LendingEngine::supported_tokens() const {
  return services_.tokens.tokens();
}

std::optional<common::Address> LendingEngine::token_ledger_address(const common::TokenId& token) const {
  return services_.tokens.ledger_address(token);
}

bool LendingEngine::admit(OpResult& result, const common::TokenId& token, const common::Amount& amount) const {
  if (amount <= 0) {
    reject(result, ErrorKind::kPolicyViolation, kRejectInvalidAmount, "amount must be positive");
    return false;
  }
  if (!services_.tokens.is_supported(token)) {
    reject(result, ErrorKind::kNotFound, kRejectUnknownToken, "token not supported: " + token);
    return false;
  }
  return true;
}

UsdPosition LendingEngine::position_locked(const ledger::Account& account) const {
  UsdPosition position;
  position.collateral = oracle::aggregate_usd(services_.prices, account.collateral);
  position.borrowed = oracle::aggregate_usd(services_.prices, account.borrowed);
  position.deposits = oracle::aggregate_usd(services_.prices, account.balances);
  position.required_collateral = policy_.required_collateral(position.borrowed);
  return position;
}

risk::RiskInputs LendingEngine::risk_inputs(const common::UserId& user) const {
  std::scoped_lock lock(mutex_);
  risk::RiskInputs inputs;
  if (const auto* account = accounts_.find(user)) {
    const UsdPosition position = position_locked(*account);
    inputs.credit_score = account->credit_score;
    inputs.collateral_usd = position.collateral;
    inputs.borrowed_usd = position.borrowed;
    inputs.deposits_usd = position.deposits;
  }
  return inputs;
}

void LendingEngine::credit_locked(const common::UserId& user,
                                  const common::TokenId& token,
                                  ledger::Field field,
                                  const common::Amount& amount) {
  if (!accounts_.adjust(user, token, field, amount)) {
    throw std::logic_error("credit to unknown account " + user);
  }
}

common::Amount LendingEngine::revert_locked(const common::UserId& user,
                                           const common::TokenId& token,
                                           ledger::Field field,
                                           const common::Amount& amount) {
  const common::Amount current = accounts_.read(user, token, field);
  // A concurrent operation may have consumed part of the tentative delta.
  const common::Amount removable = current < amount ? current : amount;
  if (!accounts_.adjust(user, token, field, -removable)) {
    throw std::logic_error("revert drove " + user + " below zero");
  }
  return amount - removable;
}

void LendingEngine::note_shortfall(const common::UserId& user,
                                   const common::TokenId& token,
                                   const common::Amount& shortfall) const {
  if (shortfall == 0) {
    return;
  }
  if (metrics_) {
    metrics_->increment(telemetry::Metric::kRevertShortfall);
  }
  common::log(log_, common::LogLevel::kWarn,
              "revert for " + user + " " + token + " short by " + common::to_string(shortfall));
}

common::CallResult LendingEngine::call_token(const common::TokenId& token, const TokenCall& call) {
  const auto address = services_.tokens.ledger_address(token);
  if (!address) {
    return common::CallResult::failure("token not registered: " + token);
  }
  auto ledger = services_.token_ledgers.resolve(*address);
  if (!ledger) {
    if (metrics_) {
      metrics_->increment(telemetry::Metric::kTokenCallFailure);
    }
    return common::CallResult::failure("no token ledger at " + *address);
  }

  common::CallResult outcome;
  try {
    telemetry::ScopedLatency timer(metrics_, telemetry::Latency::kTokenCall);
    outcome = call(*ledger);
  } catch (const std::exception& e) {
    outcome = common::CallResult::failure(std::string("token call threw: ") + e.what());
  }
  if (!outcome.ok()) {
    if (metrics_) {
      metrics_->increment(telemetry::Metric::kTokenCallFailure);
    }
    common::log(log_, common::LogLevel::kWarn, "token call on " + *address + " failed: " + outcome.reason);
  }
  return outcome;
}

OpResult& LendingEngine::reject(OpResult& result, ErrorKind error, std::uint16_t code, std::string message) const {
  result.state = OpState::kRejected;
  result.error = error;
  result.reject_code = code;
  result.message = std::move(message);
  return result;
}

OpResult& LendingEngine::finish(OpResult& result,
                                const common::UserId& user,
                                const common::TokenId& token,
                                const common::Amount& amount) const {
  std::string line = std::string(op_name(result.kind)) + " user=" + user;
  if (!token.empty()) {
    line += " token=" + token + " amount=" + common::to_string(amount);
  }
  line += ": " + std::string(state_name(result.state));
  if (result.verdict) {
    line += " risk=" + std::string(risk::verdict_name(*result.verdict));
  }
  if (!result.message.empty()) {
    line += " (" + result.message + ")";
  }

  switch (result.state) {
    case OpState::kCommitted:
      if (metrics_) {
        metrics_->increment(telemetry::Metric::kOpCommitted);
      }
      common::log(log_, result.error == ErrorKind::kNone ? common::LogLevel::kInfo : common::LogLevel::kWarn, line);
      break;
    case OpState::kReverted:
      if (metrics_) {
        metrics_->increment(telemetry::Metric::kOpReverted);
      }
      common::log(log_, common::LogLevel::kWarn, line);
      break;
    case OpState::kRejected:
      if (metrics_) {
        metrics_->increment(telemetry::Metric::kOpRejected);
      }
      common::log(log_, common::LogLevel::kWarn, line);
      break;
    case OpState::kPending:
    case OpState::kValidated:
    case OpState::kSuspended:
      common::log(log_, common::LogLevel::kError, line + " finished in a non-terminal state");
      break;
  }
  return result;
}

}  // namespace engine
}  // namespace lendcore
