#include "lendcore/common/types.hpp"

#include <stdexcept>

namespace lendcore {
namespace common {

Amount parse_amount(std::string_view text) {
  if (text.empty()) {
    throw std::invalid_argument("amount is empty");
  }
  for (const char c : text) {
    if (c < '0' || c > '9') {
      throw std::invalid_argument("amount is not a non-negative integer: " + std::string(text));
    }
  }
  return Amount(std::string(text));
}

}  // namespace common
}  // namespace lendcore
