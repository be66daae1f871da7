#include "lendcore/risk/risk_gate.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <stdexcept>

namespace lendcore {
namespace risk {

std::string_view verdict_name(Verdict verdict) noexcept {
  switch (verdict) {
    case Verdict::kSafe:
      return "safe";
    case Verdict::kHighRisk:
      return "high_risk";
    case Verdict::kUnavailable:
      return "unavailable";
  }
  return "unknown";
}

RiskGate::RiskGate(RiskServiceDirectory& services,
                   VolatilityBand band,
                   telemetry::Metrics* metrics,
                   common::LogHandler log)
    : services_(services), band_(band), metrics_(metrics), log_(std::move(log)) {
  if (band_.min <= 0.0 || band_.min > band_.max || band_.floor <= 0.0 || band_.scale <= 0.0) {
    throw std::invalid_argument("invalid volatility band");
  }
}

void RiskGate::set_endpoint(common::Address address) {
  std::scoped_lock lock(mutex_);
  endpoint_ = std::move(address);
}

void RiskGate::clear_endpoint() {
  std::scoped_lock lock(mutex_);
  endpoint_.reset();
}

std::optional<common::Address> RiskGate::endpoint() const {
  std::scoped_lock lock(mutex_);
  return endpoint_;
}

std::uint32_t RiskGate::scaled_volatility(const common::Amount& borrowed_usd,
                                          const common::Amount& deposits_usd) const {
  double volatility = band_.floor;
  if (deposits_usd > 0) {
    volatility = borrowed_usd.convert_to<double>() / deposits_usd.convert_to<double>();
    if (std::isnan(volatility)) {
      volatility = band_.max;
    }
  }
  volatility = std::clamp(volatility, band_.min, band_.max);
  return static_cast<std::uint32_t>(std::lround(volatility * band_.scale));
}

RiskRequest RiskGate::build_request(const RiskInputs& inputs) const {
  return RiskRequest{
      .collateral = inputs.collateral_usd,
      .borrowed = inputs.borrowed_usd,
      .deposits = inputs.deposits_usd,
      .volatility = scaled_volatility(inputs.borrowed_usd, inputs.deposits_usd),
      .credit_score = inputs.credit_score,
  };
}

Assessment RiskGate::evaluate(const RiskInputs& inputs) {
  const auto address = endpoint();
  if (!address) {
    if (metrics_) {
      metrics_->increment(telemetry::Metric::kRiskUnavailable);
    }
    return Assessment{};
  }

  auto service = services_.resolve(*address);
  if (!service) {
    return unavailable("no risk service at " + *address);
  }

  const RiskRequest request = build_request(inputs);
  common::log(log_, common::LogLevel::kDebug,
              "risk request to " + *address + ": collateral=" + common::to_string(request.collateral) +
                  " borrowed=" + common::to_string(request.borrowed) +
                  " deposits=" + common::to_string(request.deposits) +
                  " volatility=" + std::to_string(request.volatility));

  RiskReply reply;
  try {
    telemetry::ScopedLatency timer(metrics_, telemetry::Latency::kRiskCall);
    reply = service->assess(request);
  } catch (const std::exception& e) {
    return unavailable(std::string("risk call threw: ") + e.what());
  }

  if (!reply.call.ok()) {
    return unavailable("risk call failed: " + reply.call.reason);
  }
  if (reply.response.risk_score > 1) {
    return unavailable("malformed risk reply: score " + std::to_string(reply.response.risk_score));
  }

  Assessment assessment;
  assessment.probability = reply.response.probability;
  assessment.advice = reply.response.advice;
  if (reply.response.risk_score == 1) {
    assessment.verdict = Verdict::kHighRisk;
    if (metrics_) {
      metrics_->increment(telemetry::Metric::kRiskHighRisk);
    }
  } else {
    assessment.verdict = Verdict::kSafe;
    if (metrics_) {
      metrics_->increment(telemetry::Metric::kRiskSafe);
    }
  }
  return assessment;
}

Assessment RiskGate::unavailable(std::string_view reason) {
  common::log(log_, common::LogLevel::kWarn, reason);
  if (metrics_) {
    metrics_->increment(telemetry::Metric::kRiskUnavailable);
  }
  Assessment assessment;
  assessment.verdict = Verdict::kUnavailable;
  assessment.advice = std::string(kUnavailableAdvice);
  return assessment;
}

}  // namespace risk
}  // namespace lendcore
