#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace lendcore {
namespace config {

struct PoolConfig {
  std::string custody_account{"lendcore-pool"};
  std::int64_t default_credit_score{700};
};

struct CollateralConfig {
  std::int64_t ratio_percent{150};
};

struct RiskConfig {
  std::string endpoint{};  // empty leaves the gate fail-open
  double volatility_floor{0.01};
  double volatility_min{0.01};
  double volatility_max{0.5};
  double volatility_scale{1000.0};
};

struct TelemetryConfig {
  bool enabled{true};
};

struct TokenConfig {
  std::string symbol;
  std::string ledger;
  std::int64_t usd_price{1};
  std::string name;
  std::int64_t decimals{8};
};

struct LendcoreConfig {
  PoolConfig pool;
  CollateralConfig collateral;
  RiskConfig risk;
  TelemetryConfig telemetry;
  std::vector<TokenConfig> tokens;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  LendcoreConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const LendcoreConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace lendcore
