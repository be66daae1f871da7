#include "lendcore/risk/risk_scorer.hpp"

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace lendcore {
namespace risk {

namespace {

constexpr double kVolatilityScale = 1000.0;

double to_feature(const common::Amount& amount) {
  const double value = amount.convert_to<double>();
  if (!std::isfinite(value)) {
    return std::numeric_limits<double>::max();
  }
  return value;
}

std::string advice_for(const ScoreResult& result) {
  if (result.risk_class == 0) {
    return "Safe to borrow";
  }
  std::ostringstream oss;
  oss << "High risk (prob " << std::fixed << std::setprecision(2) << result.probability
      << "), consider increasing collateral";
  return oss.str();
}

}  // namespace

LogisticModel default_logistic_model() {
  return LogisticModel{
      .means = {0.254960, 774717.027074, 499839.415540, 1000172.144719, 574.696362},
      .stds = {0.141482, 418514.422291, 288655.995022, 577065.613148, 158.832794},
      .weights = {1.893918, -1.209705, 0.795901, 0.000843, -1.698044},
      .intercept = 2.262179,
      .threshold = 0.5,
  };
}

LogisticRegressionScorer::LogisticRegressionScorer(LogisticModel model) : model_(model) {
  for (const double std_dev : model_.stds) {
    if (std_dev == 0.0) {
      throw std::invalid_argument("logistic model standard deviation must be non-zero");
    }
  }
}

double LogisticRegressionScorer::probability(const Features& features) const {
  double z = model_.intercept;
  for (std::size_t i = 0; i < kFeatureCount; ++i) {
    const double scaled = (features[i] - model_.means[i]) / model_.stds[i];
    z += model_.weights[i] * scaled;
  }
  return 1.0 / (1.0 + std::exp(-z));
}

ScoreResult LogisticRegressionScorer::score(const Features& features) const {
  const double p = probability(features);
  return ScoreResult{
      .risk_class = static_cast<std::uint8_t>(p >= model_.threshold ? 1 : 0),
      .probability = p,
  };
}

Features features_from(const RiskRequest& request) {
  return Features{
      static_cast<double>(request.volatility) / kVolatilityScale,
      to_feature(request.collateral),
      to_feature(request.borrowed),
      to_feature(request.deposits),
      to_feature(request.credit_score),
  };
}

LocalRiskService::LocalRiskService(std::shared_ptr<const RiskScorer> scorer) : scorer_(std::move(scorer)) {
  if (!scorer_) {
    throw std::invalid_argument("LocalRiskService requires a scorer");
  }
}

RiskReply LocalRiskService::assess(const RiskRequest& request) {
  const ScoreResult result = scorer_->score(features_from(request));
  return RiskReply{
      .call = common::CallResult::success(),
      .response = RiskResponse{
          .risk_score = result.risk_class,
          .advice = advice_for(result),
          .probability = result.probability,
      },
  };
}

}  // namespace risk
}  // namespace lendcore
