#include "lendcore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <limits>
#include <set>
#include <sstream>

namespace lendcore {
namespace config {

namespace {

std::int64_t get_int_or(const toml::table& tbl, std::string_view key, std::int64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return *val;
  }
  return default_val;
}

double get_double_or(const toml::table& tbl, std::string_view key, double default_val) {
  if (auto val = tbl[key].value<double>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

PoolConfig parse_pool(const toml::table& root) {
  PoolConfig cfg;
  if (auto* pool = root["pool"].as_table()) {
    cfg.custody_account = get_str_or(*pool, "custody_account", cfg.custody_account);
    cfg.default_credit_score = get_int_or(*pool, "default_credit_score", cfg.default_credit_score);
  }
  return cfg;
}

CollateralConfig parse_collateral(const toml::table& root) {
  CollateralConfig cfg;
  if (auto* collateral = root["collateral"].as_table()) {
    cfg.ratio_percent = get_int_or(*collateral, "ratio_percent", cfg.ratio_percent);
  }
  return cfg;
}

RiskConfig parse_risk(const toml::table& root) {
  RiskConfig cfg;
  if (auto* risk = root["risk"].as_table()) {
    cfg.endpoint = get_str_or(*risk, "endpoint", cfg.endpoint);
    cfg.volatility_floor = get_double_or(*risk, "volatility_floor", cfg.volatility_floor);
    cfg.volatility_min = get_double_or(*risk, "volatility_min", cfg.volatility_min);
    cfg.volatility_max = get_double_or(*risk, "volatility_max", cfg.volatility_max);
    cfg.volatility_scale = get_double_or(*risk, "volatility_scale", cfg.volatility_scale);
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    if (auto val = (*telemetry)["enabled"].value<bool>()) {
      cfg.enabled = *val;
    }
  }
  return cfg;
}

std::vector<TokenConfig> parse_tokens(const toml::table& root) {
  std::vector<TokenConfig> tokens;
  if (auto* arr = root["tokens"].as_array()) {
    for (const auto& elem : *arr) {
      if (auto* token_tbl = elem.as_table()) {
        TokenConfig token;
        token.symbol = get_str_or(*token_tbl, "symbol", token.symbol);
        token.ledger = get_str_or(*token_tbl, "ledger", token.ledger);
        token.usd_price = get_int_or(*token_tbl, "usd_price", token.usd_price);
        token.name = get_str_or(*token_tbl, "name", token.symbol);
        token.decimals = get_int_or(*token_tbl, "decimals", token.decimals);
        tokens.push_back(std::move(token));
      }
    }
  }
  return tokens;
}

LendcoreConfig parse_config(const toml::table& root) {
  LendcoreConfig cfg;
  cfg.pool = parse_pool(root);
  cfg.collateral = parse_collateral(root);
  cfg.risk = parse_risk(root);
  cfg.telemetry = parse_telemetry(root);
  cfg.tokens = parse_tokens(root);
  return cfg;
}

LoadResult finish_load(toml::parse_result parse_result) {
  LoadResult result;
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = ConfigLoader::validate(result.config);
  result.success = result.errors.empty();
  return result;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    LoadResult result;
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }
  return finish_load(toml::parse_file(path.string()));
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  return finish_load(toml::parse(toml_content));
}

std::vector<ValidationError> ConfigLoader::validate(const LendcoreConfig& config) {
  std::vector<ValidationError> errors;

  if (config.pool.custody_account.empty()) {
    errors.push_back({"pool.custody_account", "custody_account cannot be empty"});
  }

  if (config.pool.default_credit_score < 0) {
    errors.push_back({"pool.default_credit_score", "must not be negative"});
  }

  if (config.collateral.ratio_percent < 100) {
    errors.push_back({"collateral.ratio_percent", "must be at least 100"});
  } else if (config.collateral.ratio_percent > std::numeric_limits<std::uint32_t>::max()) {
    errors.push_back({"collateral.ratio_percent", "out of range"});
  }

  if (config.risk.volatility_min <= 0.0) {
    errors.push_back({"risk.volatility_min", "must be positive"});
  }

  if (config.risk.volatility_min > config.risk.volatility_max) {
    errors.push_back({"risk", "volatility_min must be <= volatility_max"});
  }

  if (config.risk.volatility_floor <= 0.0) {
    errors.push_back({"risk.volatility_floor", "must be positive"});
  }

  if (config.risk.volatility_scale <= 0.0) {
    errors.push_back({"risk.volatility_scale", "must be positive"});
  }

  std::set<std::string> symbols;
  for (std::size_t i = 0; i < config.tokens.size(); ++i) {
    const auto& token = config.tokens[i];
    std::string prefix = "tokens[" + std::to_string(i) + "]";

    if (token.symbol.empty()) {
      errors.push_back({prefix + ".symbol", "symbol cannot be empty"});
    } else if (!symbols.insert(token.symbol).second) {
      errors.push_back({prefix + ".symbol", "duplicate symbol " + token.symbol});
    }

    if (token.ledger.empty()) {
      errors.push_back({prefix + ".ledger", "ledger address cannot be empty"});
    }

    if (token.usd_price <= 0) {
      errors.push_back({prefix + ".usd_price", "must be positive"});
    }

    if (token.decimals < 0 || token.decimals > std::numeric_limits<std::uint8_t>::max()) {
      errors.push_back({prefix + ".decimals", "must be between 0 and 255"});
    }
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# LendCore Configuration
# Generated default configuration

[pool]
custody_account = "lendcore-pool"
default_credit_score = 700

[collateral]
ratio_percent = 150  # required collateral = borrowed * 1.5

[risk]
endpoint = "risk://local"  # empty string disables the risk gate (fail-open)
volatility_floor = 0.01
volatility_min = 0.01
volatility_max = 0.5
volatility_scale = 1000.0

[telemetry]
enabled = true

[[tokens]]
symbol = "ICP"
ledger = "ledger://icp"
usd_price = 1
name = "Internet Computer"
decimals = 8

[[tokens]]
symbol = "BTC"
ledger = "ledger://btc"
usd_price = 1
name = "Bitcoin"
decimals = 8
)";
}

}  // namespace config
}  // namespace lendcore
