#include "test_engine.hpp"

#include <cassert>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "fakes.hpp"
#include "lendcore/engine/lending_engine.hpp"

namespace lendcore::tests {

using engine::ErrorKind;
using engine::OpState;

void test_engine_signup() {
  EngineHarness h;

  auto first = h.lending.signup("alice", "Alice");
  assert(first.ok());
  assert(h.lending.username("alice") == std::optional<std::string>("Alice"));

  auto again = h.lending.signup("alice", "Someone Else");
  assert(again.state == OpState::kRejected);
  assert(again.reject_code == engine::kRejectAlreadySignedUp);
  assert(*h.lending.username("alice") == "Alice");

  const auto account = h.lending.account("alice");
  assert(account);
  assert(account->credit_score == 700);
  assert(account->balances.empty());
  assert(!account->risk_advice);

  assert(!h.lending.account("bob"));
  assert(h.lending.list_users() == std::vector<common::UserId>{"alice"});
  assert(h.metrics.counter(telemetry::Metric::kSignup) == 1);
}

void test_engine_admission() {
  EngineHarness h;
  h.lending.signup("alice", "Alice");

  auto zero = h.lending.deposit_collateral("alice", "ICP", 0);
  assert(zero.state == OpState::kRejected);
  assert(zero.error == ErrorKind::kPolicyViolation);
  assert(zero.reject_code == engine::kRejectInvalidAmount);

  auto unknown_token = h.lending.borrow("alice", "DOGE", 10);
  assert(unknown_token.error == ErrorKind::kNotFound);
  assert(unknown_token.reject_code == engine::kRejectUnknownToken);

  auto unknown_user = h.lending.deposit_collateral("mallory", "ICP", 10);
  assert(unknown_user.error == ErrorKind::kNotFound);
  assert(unknown_user.reject_code == engine::kRejectUnknownAccount);
  assert(!h.lending.account("mallory"));

  auto unknown_deposit = h.lending.deposit("mallory", "ICP", 10);
  assert(unknown_deposit.reject_code == engine::kRejectUnknownAccount);

  assert(h.lending.supported_tokens() == std::vector<common::TokenId>{"ICP"});
  assert(h.lending.token_ledger_address("ICP") == std::optional<common::Address>(kIcpLedger));
  assert(!h.lending.register_token("ICP", "ledger://icp-v2"));
  assert(*h.lending.token_ledger_address("ICP") == "ledger://icp-v2");
}

void test_engine_collateral_threshold() {
  EngineHarness h;
  h.lending.signup("alice", "Alice");

  auto collateral = h.lending.deposit_collateral("alice", "ICP", 150);
  assert(collateral.ok());
  assert(collateral.verdict == risk::Verdict::kUnavailable);

  auto borrow = h.lending.borrow("alice", "ICP", 100);
  assert(borrow.ok());
  assert(h.lending.borrowed("alice", "ICP") == 100);
  assert(h.lending.balance("alice", "ICP") == 100);
  assert(h.icp->balance_of("alice") == 100);

  auto over = h.lending.borrow("alice", "ICP", 1);
  assert(over.state == OpState::kRejected);
  assert(over.error == ErrorKind::kPolicyViolation);
  assert(over.reject_code == engine::kRejectInsufficientCollateral);
  assert(h.lending.borrowed("alice", "ICP") == 100);
  assert(*h.lending.account("alice")->risk_advice == "Insufficient collateral to borrow requested amount");

  const auto position = h.lending.usd_position("alice");
  assert(position->collateral == 150);
  assert(position->borrowed == 100);
  assert(position->required_collateral == 150);

  const auto minted = h.lending.mint_log("alice");
  assert(minted.size() == 1);
  assert(minted[0].amount == 100);
  assert(ledger::MintLog::verify(h.lending.mint_log()));
}

void test_engine_price_weighted_policy() {
  EngineHarness h;
  h.prices.set_price("BTC", 20);
  auto btc = std::make_shared<FlakyTokenLedger>(kCustody);
  h.token_ledgers.bind("ledger://btc", btc);
  h.lending.register_token("BTC", "ledger://btc");
  h.lending.signup("alice", "Alice");

  // 10 BTC at 20 USD covers 133 ICP of debt at 150%.
  assert(h.lending.deposit_collateral("alice", "BTC", 10).ok());
  assert(h.lending.borrow("alice", "ICP", 133).ok());
  assert(!h.lending.borrow("alice", "ICP", 1).ok());
  assert(btc->balance_of("alice") == 0);
  assert(h.icp->balance_of("alice") == 133);
}

void test_engine_deposit_and_repay() {
  EngineHarness h;
  h.lending.signup("alice", "Alice");
  h.fund_wallet("alice", 500);

  auto deposit = h.lending.deposit("alice", "ICP", 200);
  assert(deposit.ok());
  assert(h.lending.balance("alice", "ICP") == 200);
  assert(h.icp->balance_of(kCustody) == 200);
  // 500 - 200 transferred + 200 minted back
  assert(h.icp->balance_of("alice") == 500);

  auto too_much = h.lending.deposit("alice", "ICP", 400);
  assert(too_much.state == OpState::kRejected);
  assert(too_much.error == ErrorKind::kExternalCallFailure);
  assert(too_much.reject_code == engine::kRejectTransferFailed);
  assert(h.lending.balance("alice", "ICP") == 200);

  assert(h.lending.deposit_collateral("alice", "ICP", 300).ok());
  assert(h.lending.borrow("alice", "ICP", 100).ok());
  assert(h.lending.balance("alice", "ICP") == 300);

  auto over_repay = h.lending.repay("alice", "ICP", 101);
  assert(over_repay.reject_code == engine::kRejectExceedsBorrowed);

  auto repay = h.lending.repay("alice", "ICP", 40);
  assert(repay.ok());
  assert(h.lending.borrowed("alice", "ICP") == 60);
  assert(h.lending.balance("alice", "ICP") == 260);

  h.lending.signup("bob", "Bob");
  assert(h.lending.deposit_collateral("bob", "ICP", 150).ok());
  assert(h.lending.borrow("bob", "ICP", 100).ok());
  assert(h.lending.total_supply("ICP") == 360);

  assert(h.mint_log.size() == 3);
  assert(ledger::MintLog::verify(h.lending.mint_log()));
}

void test_engine_repay_in_full() {
  EngineHarness h;
  h.lending.signup("alice", "Alice");
  assert(h.lending.deposit_collateral("alice", "ICP", 300).ok());
  assert(h.lending.borrow("alice", "ICP", 100).ok());

  assert(h.lending.repay("alice", "ICP", 90).ok());
  assert(h.lending.repay("alice", "ICP", 10).ok());
  assert(h.lending.borrowed("alice", "ICP") == 0);
  assert(h.lending.balance("alice", "ICP") == 0);

  auto nothing_owed = h.lending.repay("alice", "ICP", 1);
  assert(nothing_owed.state == OpState::kRejected);
  assert(nothing_owed.reject_code == engine::kRejectExceedsBorrowed);

  // A reverted borrow leaves the earlier debt untouched.
  assert(h.lending.borrow("alice", "ICP", 100).ok());
  h.icp->fail_mint = true;
  assert(!h.lending.borrow("alice", "ICP", 50).ok());
  h.icp->fail_mint = false;
  assert(h.lending.borrowed("alice", "ICP") == 100);
  assert(h.lending.repay("alice", "ICP", 100).ok());
  assert(h.lending.balance("alice", "ICP") == 0);
}

// deposit(X) followed by repay(X) leaves the bookkeeping balance where it
// started and lowers the debt by exactly X.
void test_engine_deposit_repay_round_trip() {
  EngineHarness h;
  h.lending.signup("alice", "Alice");
  assert(h.lending.deposit_collateral("alice", "ICP", 300).ok());
  assert(h.lending.borrow("alice", "ICP", 100).ok());
  h.fund_wallet("alice", 60);

  const common::Amount balance_before = h.lending.balance("alice", "ICP");
  const common::Amount borrowed_before = h.lending.borrowed("alice", "ICP");
  const common::Amount wallet_before = h.icp->balance_of("alice");
  assert(balance_before == 100);
  assert(borrowed_before == 100);

  assert(h.lending.deposit("alice", "ICP", 60).ok());
  assert(h.lending.balance("alice", "ICP") == balance_before + 60);
  assert(h.lending.repay("alice", "ICP", 60).ok());

  assert(h.lending.balance("alice", "ICP") == balance_before);
  assert(h.lending.borrowed("alice", "ICP") == borrowed_before - 60);
  assert(h.lending.collateral("alice", "ICP") == 300);
  assert(h.icp->balance_of("alice") == wallet_before);
}

void test_engine_withdraw_collateral() {
  EngineHarness h;
  h.lending.signup("alice", "Alice");
  assert(h.lending.deposit_collateral("alice", "ICP", 300).ok());
  assert(h.lending.borrow("alice", "ICP", 100).ok());

  auto too_much = h.lending.withdraw_collateral("alice", "ICP", 301);
  assert(too_much.reject_code == engine::kRejectInsufficientCollateral);
  assert(*h.lending.account("alice")->risk_advice == "Insufficient collateral to withdraw");

  auto breach = h.lending.withdraw_collateral("alice", "ICP", 151);
  assert(breach.state == OpState::kRejected);
  assert(breach.reject_code == engine::kRejectCollateralBreach);
  assert(*h.lending.account("alice")->risk_advice == "Cannot withdraw: would breach minimum collateral");
  assert(h.lending.collateral("alice", "ICP") == 300);

  auto ok = h.lending.withdraw_collateral("alice", "ICP", 150);
  assert(ok.ok());
  assert(h.lending.collateral("alice", "ICP") == 150);
  assert(*h.lending.account("alice")->risk_advice == "Collateral withdrawn successfully");
}

void test_engine_risk_fail_open() {
  EngineHarness h;
  h.lending.signup("alice", "Alice");

  // No endpoint: no call, no advice.
  assert(h.lending.deposit_collateral("alice", "ICP", 150).ok());
  assert(!h.lending.account("alice")->risk_advice);

  // Endpoint set but nothing listening there.
  h.lending.set_risk_service("risk://nowhere");
  auto borrow = h.lending.borrow("alice", "ICP", 50);
  assert(borrow.ok());
  assert(borrow.verdict == risk::Verdict::kUnavailable);
  assert(*h.lending.account("alice")->risk_advice == "Risk service unavailable");

  // Service that throws.
  auto scripted = std::make_shared<ScriptedRiskService>(safe_reply());
  scripted->throw_on_call("model offline");
  h.use_risk_service(scripted);
  assert(h.lending.borrow("alice", "ICP", 50).ok());
  assert(h.lending.borrowed("alice", "ICP") == 100);
  assert(h.metrics.counter(telemetry::Metric::kRiskUnavailable) == 3);
}

void test_engine_high_risk_revert() {
  EngineHarness h;
  auto scripted = std::make_shared<ScriptedRiskService>(safe_reply());
  h.use_risk_service(scripted);
  h.lending.signup("alice", "Alice");

  auto collateral = h.lending.deposit_collateral("alice", "ICP", 300);
  assert(collateral.ok());
  assert(collateral.verdict == risk::Verdict::kSafe);
  assert(*h.lending.account("alice")->risk_advice == "Safe to borrow");

  scripted->set_reply(high_risk_reply());
  auto borrow = h.lending.borrow("alice", "ICP", 100);
  assert(borrow.state == OpState::kReverted);
  assert(borrow.error == ErrorKind::kRiskRejected);
  assert(borrow.reject_code == engine::kRejectHighRisk);
  assert(h.lending.borrowed("alice", "ICP") == 0);
  assert(h.lending.balance("alice", "ICP") == 0);
  assert(h.icp->balance_of("alice") == 0);
  assert(h.mint_log.size() == 0);
  assert(*h.lending.account("alice")->risk_advice == high_risk_reply().response.advice);

  // The request carried the tentative post-state.
  const auto request = scripted->last_request();
  assert(request->borrowed == 100);
  assert(request->collateral == 300);
  assert(request->volatility == 10);
  assert(request->credit_score == 700);

  auto more_collateral = h.lending.deposit_collateral("alice", "ICP", 50);
  assert(more_collateral.state == OpState::kReverted);
  assert(h.lending.collateral("alice", "ICP") == 300);
  assert(h.metrics.counter(telemetry::Metric::kOpReverted) == 2);
}

void test_engine_tentative_state_visible() {
  EngineHarness h;
  auto blocking = std::make_shared<BlockingRiskService>(high_risk_reply());
  h.lending.signup("alice", "Alice");
  assert(h.lending.deposit_collateral("alice", "ICP", 300).ok());
  h.use_risk_service(blocking);

  engine::OpResult borrow;
  std::thread borrower([&] { borrow = h.lending.borrow("alice", "ICP", 100); });
  blocking->wait_until_entered();

  // The lock is released while the risk call is outstanding.
  assert(h.lending.borrowed("alice", "ICP") == 100);
  auto withdraw = h.lending.withdraw_collateral("alice", "ICP", 200);
  assert(withdraw.reject_code == engine::kRejectCollateralBreach);

  blocking->release();
  borrower.join();

  assert(borrow.state == OpState::kReverted);
  assert(h.lending.borrowed("alice", "ICP") == 0);
  assert(h.lending.withdraw_collateral("alice", "ICP", 200).ok());
}

void test_engine_revert_shortfall() {
  {
    // The tentative debt is repaid before the high-risk verdict lands.
    EngineHarness h;
    h.lending.signup("alice", "Alice");
    assert(h.lending.deposit_collateral("alice", "ICP", 300).ok());
    h.fund_wallet("alice", 100);
    assert(h.lending.deposit("alice", "ICP", 100).ok());
    auto blocking = std::make_shared<BlockingRiskService>(high_risk_reply());
    h.use_risk_service(blocking);

    engine::OpResult borrow;
    std::thread borrower([&] { borrow = h.lending.borrow("alice", "ICP", 100); });
    blocking->wait_until_entered();

    assert(h.lending.borrowed("alice", "ICP") == 100);
    assert(h.lending.repay("alice", "ICP", 100).ok());

    blocking->release();
    borrower.join();

    assert(borrow.state == OpState::kReverted);
    assert(borrow.reject_code == engine::kRejectHighRisk);
    assert(h.lending.borrowed("alice", "ICP") == 0);
    assert(h.lending.balance("alice", "ICP") == 0);
    assert(h.lending.collateral("alice", "ICP") == 300);
    assert(h.metrics.counter(telemetry::Metric::kRevertShortfall) == 1);
  }
  {
    // The tentative collateral is withdrawn before the verdict lands.
    EngineHarness h;
    h.lending.signup("alice", "Alice");
    auto blocking = std::make_shared<BlockingRiskService>(high_risk_reply());
    h.use_risk_service(blocking);

    engine::OpResult collateral;
    std::thread depositor([&] { collateral = h.lending.deposit_collateral("alice", "ICP", 100); });
    blocking->wait_until_entered();

    assert(h.lending.collateral("alice", "ICP") == 100);
    assert(h.lending.withdraw_collateral("alice", "ICP", 60).ok());

    blocking->release();
    depositor.join();

    assert(collateral.state == OpState::kReverted);
    assert(h.lending.collateral("alice", "ICP") == 0);
    assert(h.lending.borrowed("alice", "ICP") == 0);
    assert(h.metrics.counter(telemetry::Metric::kRevertShortfall) == 1);
  }
}

// A log handler that reads the engine back must not deadlock on any path.
void test_engine_reentrant_log_handler() {
  engine::LendingEngine* self = nullptr;
  std::size_t lines = 0;
  EngineHarness h([&](common::LogLevel, std::string_view) {
    ++lines;
    if (self) {
      (void)self->list_users();
      (void)self->account("alice");
      (void)self->total_supply("ICP");
    }
  });
  self = &h.lending;
  auto scripted = std::make_shared<ScriptedRiskService>(safe_reply());

  auto run = std::async(std::launch::async, [&] {
    h.lending.signup("alice", "Alice");
    h.lending.borrow("alice", "ICP", 10);
    h.lending.deposit_collateral("alice", "ICP", 150);
    h.lending.withdraw_collateral("alice", "ICP", 500);
    h.lending.repay("alice", "ICP", 500);
    h.use_risk_service(scripted);
    h.lending.borrow("alice", "ICP", 100);
    h.lending.repay("alice", "ICP", 40);
    scripted->set_reply(high_risk_reply());
    h.lending.borrow("alice", "ICP", 10);
    h.icp->fail_mint = true;
    scripted->set_reply(safe_reply());
    h.lending.borrow("alice", "ICP", 10);
    h.lending.withdraw_collateral("alice", "ICP", 30);
  });
  assert(run.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
  run.get();

  assert(lines > 10);
  assert(h.lending.borrowed("alice", "ICP") == 60);
  assert(h.lending.collateral("alice", "ICP") == 120);
}

void test_engine_borrow_mint_failure() {
  EngineHarness h;
  h.lending.signup("alice", "Alice");
  assert(h.lending.deposit_collateral("alice", "ICP", 300).ok());

  h.icp->fail_mint = true;
  auto failed = h.lending.borrow("alice", "ICP", 100);
  assert(failed.state == OpState::kReverted);
  assert(failed.error == ErrorKind::kExternalCallFailure);
  assert(failed.reject_code == engine::kRejectMintFailed);
  assert(h.lending.borrowed("alice", "ICP") == 0);
  assert(h.lending.balance("alice", "ICP") == 0);

  h.icp->fail_mint = false;
  h.icp->throw_on_mint = true;
  auto thrown = h.lending.borrow("alice", "ICP", 100);
  assert(thrown.state == OpState::kReverted);
  assert(h.lending.borrowed("alice", "ICP") == 0);
  assert(h.mint_log.size() == 0);
  assert(h.metrics.counter(telemetry::Metric::kTokenCallFailure) == 2);

  // Ledger unbound entirely.
  h.icp->throw_on_mint = false;
  h.token_ledgers.unbind(kIcpLedger);
  auto unbound = h.lending.borrow("alice", "ICP", 100);
  assert(unbound.error == ErrorKind::kExternalCallFailure);
  assert(h.lending.borrowed("alice", "ICP") == 0);
}

void test_engine_partial_deposit() {
  EngineHarness h;
  h.lending.signup("alice", "Alice");
  h.fund_wallet("alice", 100);
  h.icp->fail_mint = true;

  auto deposit = h.lending.deposit("alice", "ICP", 100);
  assert(deposit.state == OpState::kRejected);
  assert(deposit.error == ErrorKind::kExternalCallFailure);
  assert(deposit.reject_code == engine::kRejectMintFailed);
  assert(h.lending.balance("alice", "ICP") == 0);
  // The transfer stays in custody.
  assert(h.icp->balance_of(kCustody) == 100);
  assert(h.icp->balance_of("alice") == 0);
  assert(h.metrics.counter(telemetry::Metric::kPartialDeposit) == 1);
}

void test_engine_contribute() {
  EngineHarness h;

  // Contributions need no account.
  auto first = h.lending.contribute("carol", "ICP", 40);
  assert(first.ok());
  assert(first.error == ErrorKind::kNone);
  assert(h.crowdfund.funds("ICP") == 40);
  assert(h.icp->balance_of("carol") == 40);
  assert(!h.lending.account("carol"));

  h.icp->fail_mint = true;
  auto second = h.lending.contribute("carol", "ICP", 10);
  assert(second.state == OpState::kCommitted);
  assert(second.error == ErrorKind::kExternalCallFailure);
  assert(h.crowdfund.funds("ICP") == 50);
  assert(h.crowdfund.contribution("carol", "ICP") == 50);
  assert(h.icp->balance_of("carol") == 40);
  assert(h.mint_log.size() == 1);

  auto unknown = h.lending.contribute("carol", "DOGE", 10);
  assert(unknown.reject_code == engine::kRejectUnknownToken);
  assert(h.metrics.counter(telemetry::Metric::kContribution) == 2);
}

void test_engine_names() {
  assert(engine::op_name(engine::OpKind::kWithdrawCollateral) == "withdraw_collateral");
  assert(engine::state_name(OpState::kSuspended) == "suspended");
  assert(engine::error_name(ErrorKind::kRiskRejected) == "risk_rejected");
  EngineHarness h;
  assert(h.lending.version() == "lendcore v1.0.0");
  assert(h.lending.policy().ratio_percent() == 150);
}

}  // namespace lendcore::tests
