#pragma once

namespace lendcore::tests {

void test_collateral_policy();
void test_logistic_scorer();
void test_risk_gate_volatility();
void test_risk_gate_verdicts();

}  // namespace lendcore::tests
