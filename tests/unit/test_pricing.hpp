#pragma once

namespace lendcore::tests {

void test_price_oracle();
void test_amount_parsing();
void test_endpoint_directory();
void test_crowdfund_pool();

}  // namespace lendcore::tests
