#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "lendcore/common/logging.hpp"
#include "lendcore/common/types.hpp"
#include "lendcore/risk/risk_service.hpp"
#include "lendcore/telemetry/metrics.hpp"

namespace lendcore {
namespace risk {

enum class Verdict : std::uint8_t {
  kSafe,
  kHighRisk,
  kUnavailable,
};

[[nodiscard]] std::string_view verdict_name(Verdict verdict) noexcept;

struct RiskInputs {
  common::Amount credit_score{0};
  common::Amount collateral_usd{0};
  common::Amount borrowed_usd{0};
  common::Amount deposits_usd{0};
};

struct Assessment {
  Verdict verdict{Verdict::kUnavailable};
  double probability{0.0};
  // Text to record on the account; empty when no call was attempted.
  std::optional<std::string> advice{};
};

struct VolatilityBand {
  double floor{0.01};  // used when there are no deposits
  double min{0.01};
  double max{0.5};
  double scale{1000.0};
};

// Advisory risk check in front of the Risk Service. Never blocks an operation
// by itself: callers revert only on kHighRisk.
class RiskGate {
 public:
  static constexpr std::string_view kUnavailableAdvice = "Risk service unavailable";

  explicit RiskGate(RiskServiceDirectory& services,
                    VolatilityBand band = VolatilityBand{},
                    telemetry::Metrics* metrics = nullptr,
                    common::LogHandler log = common::LogHandler{});

  void set_endpoint(common::Address address);
  void clear_endpoint();
  [[nodiscard]] std::optional<common::Address> endpoint() const;

  [[nodiscard]] std::uint32_t scaled_volatility(const common::Amount& borrowed_usd,
                                                const common::Amount& deposits_usd) const;
  [[nodiscard]] RiskRequest build_request(const RiskInputs& inputs) const;

  // Blocks for the duration of the service call. Callers must not hold locks.
  Assessment evaluate(const RiskInputs& inputs);

 private:
  RiskServiceDirectory& services_;
  VolatilityBand band_;
  telemetry::Metrics* metrics_;
  common::LogHandler log_;

  mutable std::mutex mutex_;
  std::optional<common::Address> endpoint_{};

  Assessment unavailable(std::string_view reason);
};

}  // namespace risk
}  // namespace lendcore
