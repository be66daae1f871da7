#include "lendcore/ledger/mint_log.hpp"

#include <sodium.h>

#include <stdexcept>
#include <string>

namespace lendcore {
namespace ledger {

namespace {

class SodiumInitializer {
 public:
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};

void ensure_sodium_init() {
  static SodiumInitializer init;
}

void hash_update(crypto_generichash_state& state, const unsigned char* data, std::size_t size) {
  if (crypto_generichash_update(&state, data, size) != 0) {
    throw std::runtime_error("crypto_generichash_update failed");
  }
}

void hash_field(crypto_generichash_state& state, const std::string& value) {
  // Field terminator keeps ("ab","c") and ("a","bc") apart.
  const unsigned char terminator = 0;
  hash_update(state, reinterpret_cast<const unsigned char*>(value.data()), value.size());
  hash_update(state, &terminator, 1);
}

}  // namespace

MintLog::MintLog() {
  ensure_sodium_init();
}

MintEntry MintLog::append(const common::UserId& user,
                           const common::TokenId& token,
                           const common::Amount& amount) {
  std::scoped_lock lock(mutex_);
  MintEntry entry{
      .sequence = static_cast<common::SequenceId>(entries_.size() + 1),
      .user = user,
      .token = token,
      .amount = amount,
      .digest = {},
  };
  entry.digest = chain(head_, entry);
  head_ = entry.digest;
  entries_.push_back(std::move(entry));
  return entries_.back();
}

std::vector<MintEntry> MintLog::entries() const {
  std::scoped_lock lock(mutex_);
  return entries_;
}

std::vector<MintEntry> MintLog::entries_for(const common::UserId& user) const {
  std::scoped_lock lock(mutex_);
  std::vector<MintEntry> out;
  for (const auto& entry : entries_) {
    if (entry.user == user) {
      out.push_back(entry);
    }
  }
  return out;
}

std::size_t MintLog::size() const {
  std::scoped_lock lock(mutex_);
  return entries_.size();
}

Digest MintLog::head() const {
  std::scoped_lock lock(mutex_);
  return head_;
}

bool MintLog::verify(const std::vector<MintEntry>& entries) {
  ensure_sodium_init();
  Digest previous{};
  common::SequenceId expected_sequence = 1;
  for (const auto& entry : entries) {
    if (entry.sequence != expected_sequence++) {
      return false;
    }
    const Digest recomputed = chain(previous, entry);
    if (sodium_memcmp(recomputed.data(), entry.digest.data(), kDigestSize) != 0) {
      return false;
    }
    previous = recomputed;
  }
  return true;
}

std::string MintLog::to_hex(const Digest& digest) {
  std::string hex(kDigestSize * 2 + 1, '\0');
  sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
  hex.pop_back();
  return hex;
}

Digest MintLog::chain(const Digest& previous, const MintEntry& entry) {
  crypto_generichash_state state;
  if (crypto_generichash_init(&state, nullptr, 0, kDigestSize) != 0) {
    throw std::runtime_error("crypto_generichash_init failed");
  }
  hash_update(state, previous.data(), previous.size());

  std::array<unsigned char, sizeof(common::SequenceId)> sequence_bytes{};
  for (std::size_t i = 0; i < sequence_bytes.size(); ++i) {
    sequence_bytes[i] = static_cast<unsigned char>((entry.sequence >> (8 * i)) & 0xFF);
  }
  hash_update(state, sequence_bytes.data(), sequence_bytes.size());

  hash_field(state, entry.user);
  hash_field(state, entry.token);
  hash_field(state, common::to_string(entry.amount));

  Digest out{};
  if (crypto_generichash_final(&state, out.data(), out.size()) != 0) {
    throw std::runtime_error("crypto_generichash_final failed");
  }
  return out;
}

}  // namespace ledger
}  // namespace lendcore
