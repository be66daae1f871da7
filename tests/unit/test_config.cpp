#include "test_config.hpp"

#include <cassert>
#include <string>
#include "lendcore/config/config_loader.hpp"

namespace lendcore::tests {

namespace {

bool has_error(const config::LoadResult& result, const std::string& field) {
  for (const auto& err : result.errors) {
    if (err.field == field) {
      return true;
    }
  }
  return false;
}

}  // namespace

void test_config_default() {
  auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
  assert(result.success);
  assert(result.raw_error.empty());
  assert(result.config.pool.custody_account == "lendcore-pool");
  assert(result.config.pool.default_credit_score == 700);
  assert(result.config.collateral.ratio_percent == 150);
  assert(result.config.risk.endpoint == "risk://local");
  assert(result.config.risk.volatility_max == 0.5);
  assert(result.config.tokens.size() == 2);
  assert(result.config.tokens[0].symbol == "ICP");
  assert(result.config.tokens[0].ledger == "ledger://icp");
  assert(result.config.tokens[1].decimals == 8);
}

void test_config_overrides() {
  auto result = config::ConfigLoader::load_from_string(R"(
[pool]
custody_account = "vault"

[collateral]
ratio_percent = 200

[risk]
endpoint = ""

[telemetry]
enabled = false

[[tokens]]
symbol = "BTC"
ledger = "ledger://btc"
usd_price = 30000
)");
  assert(result.success);
  assert(result.config.pool.custody_account == "vault");
  assert(result.config.pool.default_credit_score == 700);
  assert(result.config.collateral.ratio_percent == 200);
  assert(result.config.risk.endpoint.empty());
  assert(!result.config.telemetry.enabled);
  assert(result.config.tokens.size() == 1);
  assert(result.config.tokens[0].usd_price == 30000);
  assert(result.config.tokens[0].name == "BTC");
}

void test_config_validation() {
  auto result = config::ConfigLoader::load_from_string(R"(
[pool]
custody_account = ""

[collateral]
ratio_percent = 90

[risk]
volatility_min = 0.6
volatility_max = 0.5

[[tokens]]
symbol = "ICP"
ledger = ""
usd_price = 0

[[tokens]]
symbol = "ICP"
ledger = "ledger://icp"
)");
  assert(!result.success);
  assert(has_error(result, "pool.custody_account"));
  assert(has_error(result, "collateral.ratio_percent"));
  assert(has_error(result, "risk"));
  assert(has_error(result, "tokens[0].ledger"));
  assert(has_error(result, "tokens[0].usd_price"));
  assert(has_error(result, "tokens[1].symbol"));
  assert(!has_error(result, "tokens[1].ledger"));

  // Out-of-range integers are reported, not wrapped into range.
  auto wide = config::ConfigLoader::load_from_string(R"(
[collateral]
ratio_percent = 4294967396

[[tokens]]
symbol = "ICP"
ledger = "ledger://icp"
decimals = 300
)");
  assert(!wide.success);
  assert(wide.config.collateral.ratio_percent == 4294967396);
  assert(has_error(wide, "collateral.ratio_percent"));
  assert(has_error(wide, "tokens[0].decimals"));

  auto negative = config::ConfigLoader::load_from_string(R"(
[collateral]
ratio_percent = -1

[[tokens]]
symbol = "ICP"
ledger = "ledger://icp"
decimals = -1
)");
  assert(!negative.success);
  assert(has_error(negative, "collateral.ratio_percent"));
  assert(has_error(negative, "tokens[0].decimals"));

  auto broken = config::ConfigLoader::load_from_string("[pool\ncustody_account = ");
  assert(!broken.success);
  assert(!broken.raw_error.empty());

  auto missing = config::ConfigLoader::load("/nonexistent/lendcore.toml");
  assert(!missing.success);
  assert(missing.raw_error.find("not found") != std::string::npos);
}

}  // namespace lendcore::tests
