#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace common {

// Maps collaborator addresses to live instances. Addresses are plain strings
// ("local://risk-scorer", "token://usdt"); a lookup miss means the collaborator
// is unreachable.
template <typename Service>
class EndpointDirectory {
 public:
  void bind(const Address& address, std::shared_ptr<Service> service) {
    std::scoped_lock lock(mutex_);
    services_[address] = std::move(service);
  }

  void unbind(const Address& address) {
    std::scoped_lock lock(mutex_);
    services_.erase(address);
  }

  [[nodiscard]] std::shared_ptr<Service> resolve(const Address& address) const {
    std::scoped_lock lock(mutex_);
    if (auto it = services_.find(address); it != services_.end()) {
      return it->second;
    }
    return nullptr;
  }

  [[nodiscard]] std::vector<Address> addresses() const {
    std::scoped_lock lock(mutex_);
    std::vector<Address> out;
    out.reserve(services_.size());
    for (const auto& [address, service] : services_) {
      out.push_back(address);
    }
    return out;
  }

 private:
  mutable std::mutex mutex_;
  std::unordered_map<Address, std::shared_ptr<Service>> services_{};
};

}  // namespace common
}  // namespace lendcore
