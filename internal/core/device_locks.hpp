#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace fieldwake::core {

/*
  One mutex per device id. Deliveries for the same device are handled one
  at a time; different devices never contend past the map lookup.
*/
class DeviceLocks {
 public:
  std::shared_ptr<std::mutex> For(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(guard_);
    auto&                       device_mutex = mutexes_[device_id];
    if (!device_mutex) {
      device_mutex = std::make_shared<std::mutex>();
    }
    return device_mutex;
  }

 private:
  std::mutex                                                   guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> mutexes_;
};

} // namespace fieldwake::core
