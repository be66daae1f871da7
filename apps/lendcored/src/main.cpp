#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lendcore/config/config_loader.hpp"
#include "lendcore/crowdfund/crowdfund_pool.hpp"
#include "lendcore/engine/lending_engine.hpp"
#include "lendcore/ledger/mint_log.hpp"
#include "lendcore/ledger/token_registry.hpp"
#include "lendcore/oracle/price_oracle.hpp"
#include "lendcore/risk/risk_gate.hpp"
#include "lendcore/risk/risk_scorer.hpp"
#include "lendcore/telemetry/metrics.hpp"
#include "lendcore/token/in_memory_token_ledger.hpp"

namespace {

using namespace lendcore;

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [config_file] [script_file]\n"
            << "  config_file: Path to TOML configuration file\n"
            << "               If not specified, uses ./lendcore.toml or generates defaults\n"
            << "  script_file: Commands to execute, one per line (default: stdin)\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 1) {
    return std::filesystem::path{argv[1]};
  }

  std::filesystem::path default_paths[] = {
      "./lendcore.toml",
      "/etc/lendcore/lendcore.toml",
      std::filesystem::path{getenv("HOME") ? getenv("HOME") : ""} / ".config/lendcore/lendcore.toml",
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

// Everything the command loop talks to, wired from the loaded config.
struct Node {
  explicit Node(const config::LendcoreConfig& cfg, common::LogHandler log)
      : risk_gate(risk_services,
                  risk::VolatilityBand{
                      .floor = cfg.risk.volatility_floor,
                      .min = cfg.risk.volatility_min,
                      .max = cfg.risk.volatility_max,
                      .scale = cfg.risk.volatility_scale,
                  },
                  cfg.telemetry.enabled ? &metrics : nullptr,
                  log),
        custody(cfg.pool.custody_account),
        lending(engine::EngineServices{
                   .prices = prices,
                   .risk_gate = risk_gate,
                   .tokens = tokens,
                   .token_ledgers = token_ledgers,
                   .mint_log = mint_log,
                   .crowdfund = crowdfund,
               },
               engine::EngineConfig{
                   .custody_account = cfg.pool.custody_account,
                   .default_credit_score = cfg.pool.default_credit_score,
                   .collateral_ratio_percent = static_cast<std::uint32_t>(cfg.collateral.ratio_percent),
               },
               cfg.telemetry.enabled ? &metrics : nullptr,
               log) {}

  telemetry::Metrics metrics;
  oracle::StaticPriceOracle prices;
  risk::RiskServiceDirectory risk_services;
  risk::RiskGate risk_gate;
  ledger::TokenRegistry tokens;
  token::TokenLedgerDirectory token_ledgers;
  ledger::MintLog mint_log;
  crowdfund::CrowdfundPool crowdfund;
  common::UserId custody;
  engine::LendingEngine lending;

  void add_token(const common::TokenId& symbol, const common::Address& address, token::TokenMetadata metadata) {
    if (!token_ledgers.resolve(address)) {
      token_ledgers.bind(address, std::make_shared<token::InMemoryTokenLedger>(std::move(metadata), custody));
    }
    lending.register_token(symbol, address);
  }

  std::shared_ptr<token::InMemoryTokenLedger> ledger_for(const common::TokenId& symbol) const {
    const auto address = tokens.ledger_address(symbol);
    if (!address) {
      throw std::invalid_argument("unknown token " + symbol);
    }
    auto ledger = std::dynamic_pointer_cast<token::InMemoryTokenLedger>(token_ledgers.resolve(*address));
    if (!ledger) {
      throw std::invalid_argument("no local ledger at " + *address);
    }
    return ledger;
  }
};

void print_result(const engine::OpResult& result) {
  std::cout << engine::op_name(result.kind) << ": " << engine::state_name(result.state);
  if (result.error != engine::ErrorKind::kNone) {
    std::cout << " [" << engine::error_name(result.error) << " " << result.reject_code << "]";
  }
  if (result.verdict) {
    std::cout << " risk=" << risk::verdict_name(*result.verdict);
  }
  if (!result.message.empty()) {
    std::cout << " " << result.message;
  }
  std::cout << "\n";
}

void print_amounts(std::string_view label, const ledger::TokenAmounts& amounts) {
  std::cout << "  " << label << ":";
  if (amounts.empty()) {
    std::cout << " -";
  }
  for (const auto& [token, amount] : amounts) {
    std::cout << " " << token << "=" << amount;
  }
  std::cout << "\n";
}

std::vector<std::string> split(const std::string& line) {
  std::istringstream iss(line);
  std::vector<std::string> words;
  std::string word;
  while (iss >> word) {
    words.push_back(word);
  }
  return words;
}

void require_args(const std::vector<std::string>& args, std::size_t count, std::string_view usage) {
  if (args.size() < count + 1) {
    throw std::invalid_argument("usage: " + std::string(usage));
  }
}

// Returns false once the script asks to stop.
bool execute(Node& node, const std::vector<std::string>& args) {
  const std::string& cmd = args[0];
  auto& lending = node.lending;

  using Operation = engine::OpResult (engine::LendingEngine::*)(
      const common::UserId&, const common::TokenId&, const common::Amount&);
  static const std::pair<std::string_view, Operation> kOperations[] = {
      {"deposit", &engine::LendingEngine::deposit},
      {"deposit_collateral", &engine::LendingEngine::deposit_collateral},
      {"borrow", &engine::LendingEngine::borrow},
      {"repay", &engine::LendingEngine::repay},
      {"withdraw_collateral", &engine::LendingEngine::withdraw_collateral},
      {"contribute", &engine::LendingEngine::contribute},
  };
  for (const auto& [name, operation] : kOperations) {
    if (cmd == name) {
      require_args(args, 3, std::string(name) + " <user> <token> <amount>");
      print_result((lending.*operation)(args[1], args[2], common::parse_amount(args[3])));
      return true;
    }
  }

  if (cmd == "quit" || cmd == "exit") {
    return false;
  } else if (cmd == "signup") {
    require_args(args, 1, "signup <user> [username]");
    print_result(lending.signup(args[1], args.size() > 2 ? args[2] : args[1]));
  } else if (cmd == "approve") {
    require_args(args, 3, "approve <user> <token> <amount>");
    node.ledger_for(args[2])->approve(args[1], node.custody, common::parse_amount(args[3]));
    std::cout << "approved " << args[3] << " " << args[2] << " from " << args[1] << "\n";
  } else if (cmd == "faucet") {
    require_args(args, 3, "faucet <user> <token> <amount>");
    const auto minted = node.ledger_for(args[2])->mint(args[1], common::parse_amount(args[3]));
    std::cout << "faucet: " << (minted.ok() ? "ok" : minted.reason) << "\n";
  } else if (cmd == "wallet") {
    require_args(args, 2, "wallet <user> <token>");
    std::cout << args[1] << " holds " << node.ledger_for(args[2])->balance_of(args[1]) << " " << args[2] << "\n";
  } else if (cmd == "account") {
    require_args(args, 1, "account <user>");
    const auto account = lending.account(args[1]);
    if (!account) {
      std::cout << "no account " << args[1] << "\n";
      return true;
    }
    std::cout << args[1] << " (" << account->username.value_or("-") << ") credit_score=" << account->credit_score
              << "\n";
    print_amounts("balances", account->balances);
    print_amounts("collateral", account->collateral);
    print_amounts("borrowed", account->borrowed);
    std::cout << "  advice: " << account->risk_advice.value_or("-") << "\n";
    if (const auto position = lending.usd_position(args[1])) {
      std::cout << "  usd: collateral=" << position->collateral << " borrowed=" << position->borrowed
                << " deposits=" << position->deposits << " required=" << position->required_collateral << "\n";
    }
  } else if (cmd == "balance") {
    require_args(args, 2, "balance <user> <token>");
    std::cout << lending.balance(args[1], args[2]) << "\n";
  } else if (cmd == "users") {
    for (const auto& user : lending.list_users()) {
      std::cout << user << "\n";
    }
  } else if (cmd == "supply") {
    require_args(args, 1, "supply <token>");
    std::cout << lending.total_supply(args[1]) << "\n";
  } else if (cmd == "mint_log") {
    const auto entries = args.size() > 1 ? lending.mint_log(args[1]) : lending.mint_log();
    for (const auto& entry : entries) {
      std::cout << entry.sequence << " " << entry.user << " " << entry.token << " " << entry.amount << " "
                << ledger::MintLog::to_hex(entry.digest) << "\n";
    }
    std::cout << "chain " << (ledger::MintLog::verify(lending.mint_log()) ? "verified" : "BROKEN") << "\n";
  } else if (cmd == "funds") {
    for (const auto& [token, amount] : node.crowdfund.all_funds()) {
      std::cout << token << " " << amount << "\n";
    }
  } else if (cmd == "tokens") {
    for (const auto& token : lending.supported_tokens()) {
      std::cout << token << " " << lending.token_ledger_address(token).value_or("-") << "\n";
    }
  } else if (cmd == "register_token") {
    require_args(args, 2, "register_token <symbol> <ledger_address>");
    node.add_token(args[1], args[2], token::TokenMetadata{.name = args[1], .symbol = args[1]});
    std::cout << "registered " << args[1] << "\n";
  } else if (cmd == "set_risk") {
    require_args(args, 1, "set_risk <address>");
    lending.set_risk_service(args[1]);
    std::cout << "risk service " << args[1] << "\n";
  } else if (cmd == "version") {
    std::cout << lending.version() << "\n";
  } else if (cmd == "metrics") {
    for (const auto& sample : node.metrics.counters()) {
      std::cout << telemetry::metric_name(sample.metric) << " " << sample.value << "\n";
    }
    for (const auto& summary : node.metrics.drain_latency()) {
      std::cout << telemetry::latency_name(summary.latency) << " count=" << summary.count
                << " mean_ns=" << summary.mean_ns << " p99_ns=" << summary.p99_ns << "\n";
    }
  } else {
    throw std::invalid_argument("unknown command " + cmd);
  }
  return true;
}

void run_script(Node& node, std::istream& in) {
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    const auto args = split(line);
    if (args.empty() || args[0].front() == '#') {
      continue;
    }
    try {
      if (!execute(node, args)) {
        return;
      }
    } catch (const std::invalid_argument& e) {
      std::cerr << "line " << line_number << ": " << e.what() << "\n";
    }
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  auto config_path = find_config_path(argc, argv);
  config::LendcoreConfig cfg;

  if (config_path.empty()) {
    std::clog << "No config file found, using defaults\n";
    auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
    if (!result.success) {
      std::cerr << "Failed to load default config: " << result.raw_error << "\n";
      return 1;
    }
    cfg = std::move(result.config);
  } else {
    std::clog << "Loading config from: " << config_path << "\n";
    auto result = config::ConfigLoader::load(config_path);
    if (!result.success) {
      if (!result.raw_error.empty()) {
        std::cerr << "Parse error: " << result.raw_error << "\n";
      }
      for (const auto& err : result.errors) {
        std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
      }
      print_usage(argv[0]);
      return 1;
    }
    cfg = std::move(result.config);
  }

  auto log = [](common::LogLevel level, std::string_view message) {
    std::clog << "[" << common::level_name(level) << "] " << message << "\n";
  };

  Node node(cfg, log);

  for (const auto& token_cfg : cfg.tokens) {
    node.prices.set_price(token_cfg.symbol, token_cfg.usd_price);
    node.add_token(token_cfg.symbol, token_cfg.ledger,
                   token::TokenMetadata{.name = token_cfg.name, .symbol = token_cfg.symbol, .decimals = static_cast<std::uint8_t>(token_cfg.decimals)});
  }

  // The configured endpoint is served by the in-process scorer.
  if (!cfg.risk.endpoint.empty()) {
    node.risk_services.bind(cfg.risk.endpoint, std::make_shared<risk::LocalRiskService>(
                                                   std::make_shared<risk::LogisticRegressionScorer>()));
    node.lending.set_risk_service(cfg.risk.endpoint);
  }

  std::clog << node.lending.version() << " ready\n"
            << "  Custody account: " << cfg.pool.custody_account << "\n"
            << "  Collateral ratio: " << cfg.collateral.ratio_percent << "%\n"
            << "  Risk endpoint: " << (cfg.risk.endpoint.empty() ? "(unset, fail-open)" : cfg.risk.endpoint) << "\n"
            << "  Tokens: " << cfg.tokens.size() << "\n";

  if (argc > 2) {
    std::ifstream script(argv[2]);
    if (!script) {
      std::cerr << "Cannot open script: " << argv[2] << "\n";
      return 1;
    }
    run_script(node, script);
  } else {
    run_script(node, std::cin);
  }
  return 0;
}
