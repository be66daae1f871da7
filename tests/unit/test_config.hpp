#pragma once

namespace lendcore::tests {

void test_config_default();
void test_config_overrides();
void test_config_validation();

}  // namespace lendcore::tests
