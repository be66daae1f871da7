#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

namespace lendcore {
namespace common {

using UserId = std::string;
using TokenId = std::string;
using Address = std::string;
using SequenceId = std::uint64_t;

// Unbounded integer. Ledger quantities are kept non-negative by every mutator.
using Amount = boost::multiprecision::cpp_int;

inline constexpr std::string_view kVersion = "lendcore v1.0.0";

enum class CallStatus : std::uint8_t {
  kSuccess,
  kFailure,
};

// Outcome of a call into an external collaborator.
struct CallResult {
  CallStatus status{CallStatus::kSuccess};
  std::string reason{};

  [[nodiscard]] bool ok() const noexcept { return status == CallStatus::kSuccess; }

  static CallResult success() { return CallResult{}; }
  static CallResult failure(std::string why) {
    return CallResult{.status = CallStatus::kFailure, .reason = std::move(why)};
  }
};

[[nodiscard]] inline std::string to_string(const Amount& amount) {
  return amount.str();
}

// Parses a non-negative decimal integer; throws std::invalid_argument otherwise.
[[nodiscard]] Amount parse_amount(std::string_view text);

}  // namespace common
}  // namespace lendcore
