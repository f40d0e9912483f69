#pragma once
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

// Process-wide serialization. Detection runs hold their shift's mutex and a
// shared hold on the carpool gate; the daily carpool batch takes the gate
// exclusively so no trip is created or deleted while it groups.
class ShiftLocks {
public:
  std::shared_ptr<std::mutex> for_shift(const std::string &shift_id) {
    std::lock_guard<std::mutex> lk(registry_mu_);
    auto &slot = registry_[shift_id];
    auto m = slot.lock();
    if (!m) {
      m = std::make_shared<std::mutex>();
      slot = m;
    }
    // drop entries whose runs have finished
    if (registry_.size() > 1024) {
      for (auto it = registry_.begin(); it != registry_.end();) {
        if (it->second.expired())
          it = registry_.erase(it);
        else
          ++it;
      }
    }
    return m;
  }

  std::shared_mutex &carpool_gate() noexcept { return gate_; }

private:
  std::mutex registry_mu_;
  std::unordered_map<std::string, std::weak_ptr<std::mutex>> registry_;
  std::shared_mutex gate_;
};
