#include "command_mailbox.hpp"

namespace flotilla::bus {

void CommandMailbox::Enqueue(const flotilla::v1::DroneCommand& command) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;
    queue_.push_back(command);
  }
  cv_.notify_one();
}

void CommandMailbox::Requeue(const flotilla::v1::DroneCommand& command) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;
    queue_.push_front(command);
  }
  cv_.notify_one();
}

std::optional<flotilla::v1::DroneCommand> CommandMailbox::Dequeue(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  cv_.wait_for(lock, timeout, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  auto command = std::move(queue_.front());
  queue_.pop_front();
  return command;
}

std::deque<flotilla::v1::DroneCommand> CommandMailbox::Drain() {
  std::lock_guard lock(mutex_);
  std::deque<flotilla::v1::DroneCommand> out;
  out.swap(queue_);
  return out;
}

void CommandMailbox::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

bool CommandMailbox::IsShutdown() {
  std::lock_guard lock(mutex_);
  return shutdown_;
}

std::size_t CommandMailbox::Size() {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace flotilla::bus
