#pragma once

namespace lendcore::tests {

void test_engine_signup();
void test_engine_admission();
void test_engine_collateral_threshold();
void test_engine_price_weighted_policy();
void test_engine_deposit_and_repay();
void test_engine_repay_in_full();
void test_engine_deposit_repay_round_trip();
void test_engine_withdraw_collateral();
void test_engine_risk_fail_open();
void test_engine_high_risk_revert();
void test_engine_tentative_state_visible();
void test_engine_revert_shortfall();
void test_engine_reentrant_log_handler();
void test_engine_borrow_mint_failure();
void test_engine_partial_deposit();
void test_engine_contribute();
void test_engine_names();

}  // namespace lendcore::tests
