#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

#include "flotilla/v1.hpp"

namespace flotilla::bus {

/*
  Thread-safe blocking queue of commands for one drone.
*/
class CommandMailbox {
 public:
  void Enqueue(const flotilla::v1::DroneCommand& command);

  // Puts a command that could not be delivered back at the front.
  void Requeue(const flotilla::v1::DroneCommand& command);

  // Waits up to `timeout`; nullopt on timeout or once shut down and empty.
  std::optional<flotilla::v1::DroneCommand> Dequeue(std::chrono::milliseconds timeout);

  // Removes and returns everything queued.
  std::deque<flotilla::v1::DroneCommand> Drain();

  void Shutdown();
  bool IsShutdown();

  std::size_t Size();

 private:
  std::mutex                             mutex_;
  std::condition_variable                cv_;
  std::deque<flotilla::v1::DroneCommand> queue_;
  bool                                   shutdown_ = false;
};

} // namespace flotilla::bus
