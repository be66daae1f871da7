#pragma once

#include <cstdint>
#include <string>

#include "lendcore/common/endpoint_directory.hpp"
#include "lendcore/common/types.hpp"

namespace lendcore {
namespace risk {

struct RiskRequest {
  common::Amount collateral{0};  // USD
  common::Amount borrowed{0};    // USD
  common::Amount deposits{0};    // USD
  std::uint32_t volatility{0};   // ratio * 1000, within [10, 500]
  common::Amount credit_score{0};
};

struct RiskResponse {
  std::uint8_t risk_score{0};  // 0 = safe, 1 = high risk
  std::string advice{};
  double probability{0.0};
};

struct RiskReply {
  common::CallResult call{};
  RiskResponse response{};
};

// Request/response access to a risk model. Implementations may block.
class RiskService {
 public:
  virtual ~RiskService() = default;

  virtual RiskReply assess(const RiskRequest& request) = 0;
};

using RiskServiceDirectory = common::EndpointDirectory<RiskService>;

}  // namespace risk
}  // namespace lendcore
