#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string_view>

#include "lendcore/risk/risk_service.hpp"

namespace lendcore {
namespace risk {

inline constexpr std::size_t kFeatureCount = 5;

// [volatility ratio, collateral, borrowed, deposits, credit score]
using Features = std::array<double, kFeatureCount>;

struct ScoreResult {
  std::uint8_t risk_class{0};
  double probability{0.0};
};

class RiskScorer {
 public:
  virtual ~RiskScorer() = default;

  [[nodiscard]] virtual ScoreResult score(const Features& features) const = 0;
};

struct LogisticModel {
  Features means{};
  Features stds{};
  Features weights{};
  double intercept{0.0};
  double threshold{0.5};
};

// Coefficients of the deployed model (trained on 2.5M user positions).
[[nodiscard]] LogisticModel default_logistic_model();

class LogisticRegressionScorer : public RiskScorer {
 public:
  explicit LogisticRegressionScorer(LogisticModel model = default_logistic_model());

  [[nodiscard]] double probability(const Features& features) const;
  [[nodiscard]] ScoreResult score(const Features& features) const override;

 private:
  LogisticModel model_;
};

[[nodiscard]] Features features_from(const RiskRequest& request);

// Serves RiskService requests from an in-process scorer.
class LocalRiskService : public RiskService {
 public:
  static constexpr std::string_view kVersion = "risk-scorer v1.0.0";

  explicit LocalRiskService(std::shared_ptr<const RiskScorer> scorer);

  RiskReply assess(const RiskRequest& request) override;

 private:
  std::shared_ptr<const RiskScorer> scorer_;
};

}  // namespace risk
}  // namespace lendcore
