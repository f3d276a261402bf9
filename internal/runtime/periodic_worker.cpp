#include "periodic_worker.hpp"

#include "internal/observability/logging.hpp"

namespace flotilla::runtime {

PeriodicWorker::PeriodicWorker(std::string name, std::chrono::milliseconds interval, Task task)
    : name_(std::move(name)), interval_(interval), task_(std::move(task)) {
}

PeriodicWorker::~PeriodicWorker() {
  Stop();
}

void PeriodicWorker::Start() {
  {
    std::lock_guard lock(mutex_);
    if (running_) return;
    running_ = true;
  }
  thread_ = std::thread(&PeriodicWorker::Run, this);
  FLOTILLA_LOG_INFO("background worker started",
                    {observability::StringField("worker", name_), observability::IntField("interval_ms", interval_.count())});
}

void PeriodicWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void PeriodicWorker::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, interval_, [this] { return !running_; })) break;

    lock.unlock();
    try {
      task_();
    } catch (const std::exception& e) {
      FLOTILLA_LOG_ERROR("background worker tick failed", {observability::StringField("worker", name_), observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace flotilla::runtime
