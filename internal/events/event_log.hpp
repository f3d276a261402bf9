#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/message.h>

#include "flotilla/v1.hpp"
#include "internal/db/api/repository.hpp"

namespace flotilla::events {

namespace kind {
inline constexpr std::string_view kBackendStatus   = "backend_status";
inline constexpr std::string_view kBackendOrphaned = "backend_orphaned";
inline constexpr std::string_view kDroneStatus     = "drone_status";
inline constexpr std::string_view kDroneDrain      = "drone_drain";
inline constexpr std::string_view kKeyAcquired     = "key_acquired";
inline constexpr std::string_view kKeyReleased     = "key_released";
} // namespace kind

struct SubscriptionOptions {
  // Only events with a larger id are delivered.
  uint64_t after_id = 0;

  // Entity scope; unset subscribes to every event.
  std::optional<std::string> key;

  // Upper bound on events returned by one Next() call.
  uint64_t batch_size = 256;
};

/*
  Wakes subscribers when this process commits new events. Subscribers also
  poll, so events committed by other controller instances on a shared store
  are picked up within kPollInterval.
*/
class EventNotifier {
 public:
  uint64_t Generation();

  void Notify();

  // Returns when the generation moved past `seen`, on shutdown, or after `timeout`.
  void WaitFor(uint64_t seen, std::chrono::milliseconds timeout);

  void Shutdown();
  bool IsShutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  uint64_t                generation_ = 0;
  bool                    shutdown_   = false;
};

class Subscription {
 public:
  static constexpr std::chrono::milliseconds kPollInterval{250};

  Subscription(std::shared_ptr<db::Repository> repository, std::shared_ptr<EventNotifier> notifier, SubscriptionOptions options);

  Subscription(const Subscription&)            = delete;
  Subscription& operator=(const Subscription&) = delete;

  /*
    Blocks until at least one event is available or `timeout` elapses.
    Returns an empty batch on timeout and nullopt once the subscription or
    the log was shut down.
  */
  std::optional<std::vector<flotilla::v1::Event>> Next(std::chrono::milliseconds timeout);

  void Cancel();

  uint64_t Cursor() const {
    return cursor_;
  }

 private:
  std::vector<flotilla::v1::Event> Poll();

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<EventNotifier>  notifier_;
  SubscriptionOptions             options_;
  uint64_t                        cursor_;
  std::atomic<bool>               cancelled_{false};
};

class EventLog {
 public:
  // retention_max_entries == 0 keeps every event
  EventLog(std::shared_ptr<db::Repository> repository, uint64_t retention_max_entries);

  /*
    Appends inside the caller's transaction. The payload is stored in its
    canonical protobuf JSON mapping. Call NotifyCommitted() once the
    transaction committed.
  */
  uint64_t Append(db::Transaction& tx, std::string_view kind, std::optional<std::string> key, const google::protobuf::Message& payload);

  void NotifyCommitted();

  std::unique_ptr<Subscription> Subscribe(SubscriptionOptions options);

  // Id of the newest event, 0 if none was ever written.
  uint64_t LatestId();

  std::vector<flotilla::v1::Event> Read(uint64_t after_id, const std::optional<std::string>& key, std::optional<uint64_t> max_entries);

  void Shutdown();

  static flotilla::v1::Event ToProto(const db::model::EventRecord& record);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<EventNotifier>  notifier_;
  uint64_t                        retention_max_entries_;
};

} // namespace flotilla::events
