#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "fieldwake/v1.hpp"

namespace fieldwake::command {

/*
  Bounded blocking queue between the publisher and the bridge streams.

  Each command is handed to exactly one consumer. When full, the oldest
  command is dropped to make room: a device that missed a directive
  re-wakes on its own timer.
*/
class CommandQueue {
 public:
  explicit CommandQueue(std::size_t capacity);

  // false when an older command had to be dropped
  bool Push(fieldwake::v1::DeviceCommand command);

  // Waits up to `timeout`; nullopt on timeout or after Shutdown() once drained.
  std::optional<fieldwake::v1::DeviceCommand> Pop(std::chrono::milliseconds timeout);

  void Shutdown();

  bool IsShutdown() const;

  std::size_t Size() const;

  std::size_t Dropped() const;

 private:
  const std::size_t capacity_;

  mutable std::mutex                       mutex_;
  std::condition_variable                  cv_;
  std::deque<fieldwake::v1::DeviceCommand> queue_;
  std::size_t                              dropped_  = 0;
  bool                                     shutdown_ = false;
};

} // namespace fieldwake::command
