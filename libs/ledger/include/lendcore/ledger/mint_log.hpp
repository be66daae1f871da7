#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace ledger {

constexpr std::size_t kDigestSize = 32;
using Digest = std::array<std::uint8_t, kDigestSize>;

struct MintEntry {
  common::SequenceId sequence{0};
  common::UserId user{};
  common::TokenId token{};
  common::Amount amount{0};
  // BLAKE2b-256 over the previous entry's digest and this entry's fields.
  Digest digest{};
};

// Append-only audit trail of mint events, hash-chained so that any edit to a
// past entry is detectable.
class MintLog {
 public:
  MintLog();

  MintEntry append(const common::UserId& user, const common::TokenId& token, const common::Amount& amount);

  [[nodiscard]] std::vector<MintEntry> entries() const;
  [[nodiscard]] std::vector<MintEntry> entries_for(const common::UserId& user) const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] Digest head() const;

  // Recomputes the chain over `entries` starting from the zero digest.
  [[nodiscard]] static bool verify(const std::vector<MintEntry>& entries);
  [[nodiscard]] static std::string to_hex(const Digest& digest);

 private:
  mutable std::mutex mutex_;
  std::vector<MintEntry> entries_{};
  Digest head_{};

  static Digest chain(const Digest& previous, const MintEntry& entry);
};

}  // namespace ledger
}  // namespace lendcore
