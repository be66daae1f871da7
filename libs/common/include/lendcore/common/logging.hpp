#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

namespace lendcore {
namespace common {

enum class LogLevel : std::uint8_t {
  kDebug,
  kInfo,
  kWarn,
  kError,
};

// Sink for component log lines. A default-constructed handler discards everything.
using LogHandler = std::function<void(LogLevel, std::string_view)>;

inline constexpr std::string_view level_name(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "unknown";
}

inline void log(const LogHandler& handler, LogLevel level, std::string_view message) {
  if (handler) {
    handler(level, message);
  }
}

}  // namespace common
}  // namespace lendcore
