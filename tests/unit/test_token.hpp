#pragma once

namespace lendcore::tests {

void test_in_memory_token_ledger();

}  // namespace lendcore::tests
