#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace flotilla::runtime {

/*
  Background thread running one task on a fixed interval.

  Used for the termination watchdog and the drone staleness sweep. A task
  that throws is logged and retried on the next tick.
*/
class PeriodicWorker {
 public:
  using Task = std::function<void()>;

  PeriodicWorker(std::string name, std::chrono::milliseconds interval, Task task);
  ~PeriodicWorker();

  PeriodicWorker(const PeriodicWorker&)            = delete;
  PeriodicWorker& operator=(const PeriodicWorker&) = delete;

  void Start();
  void Stop();

  const std::string& name() const {
    return name_;
  }

 private:
  void Run();

  std::string               name_;
  std::chrono::milliseconds interval_;
  Task                      task_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
  std::thread             thread_;
};

} // namespace flotilla::runtime
