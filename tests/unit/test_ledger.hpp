#pragma once

namespace lendcore::tests {

void test_account_store();
void test_token_registry();
void test_mint_log_chain();

}  // namespace lendcore::tests
