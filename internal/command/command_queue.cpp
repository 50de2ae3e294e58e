#include "internal/command/command_queue.hpp"

#include "internal/observability/logging.hpp"

namespace fieldwake::command {

CommandQueue::CommandQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

bool CommandQueue::Push(fieldwake::v1::DeviceCommand command) {
  bool dropped = false;
  {
    std::lock_guard lock(mutex_);
    if (queue_.size() >= capacity_) {
      FIELDWAKE_LOG_WARN("command queue full; dropping oldest command",
                         {observability::StringField("device_id", queue_.front().device_id()),
                          observability::StringField("topic", queue_.front().topic())});
      queue_.pop_front();
      ++dropped_;
      dropped = true;
    }
    queue_.push_back(std::move(command));
  }
  cv_.notify_one();
  return !dropped;
}

std::optional<fieldwake::v1::DeviceCommand> CommandQueue::Pop(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  cv_.wait_for(lock, timeout, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  auto command = std::move(queue_.front());
  queue_.pop_front();
  return command;
}

void CommandQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

bool CommandQueue::IsShutdown() const {
  std::lock_guard lock(mutex_);
  return shutdown_;
}

std::size_t CommandQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

std::size_t CommandQueue::Dropped() const {
  std::lock_guard lock(mutex_);
  return dropped_;
}

} // namespace fieldwake::command
