#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "flotilla/v1.hpp"
#include "internal/db/api/repository.hpp"

namespace flotilla::bus {
class DroneBus;
}

namespace flotilla::events {
class EventLog;
}

namespace flotilla::lock {
class KeyLockTable;
}

namespace flotilla::core {

/*
  Monotonic status application for backends.

  Reports from drones and explicit terminate calls both funnel through
  ApplyStatusInTx(): the stored status only moves to a strictly greater
  value, and reaching Terminated releases the backend's key lock in the
  same transaction.
*/
class BackendLifecycle {
 public:
  BackendLifecycle(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventLog> events,
                   std::shared_ptr<lock::KeyLockTable> locks, std::shared_ptr<bus::DroneBus> bus);

  // Returns true when the status was applied. Throws util::NotFound.
  bool ApplyStatus(const std::string& backend_id, flotilla::v1::BackendStatus status, uint64_t time_ms);

  bool ApplyStatusInTx(db::Transaction& tx, db::model::BackendRecord& backend, flotilla::v1::BackendStatus status, uint64_t time_ms);

  /*
    Records Terminating (soft) or HardTerminating (hard) and sends the
    terminate command to the owning drone. A backend already at or past
    the requested status is left alone and no command is sent.

    When the owning drone is terminated or gone the backend is moved
    straight to Terminated, releasing its key lock, and nothing is sent.
  */
  bool Terminate(const std::string& backend_id, flotilla::v1::TerminationKind kind, uint64_t now_ms);

  static flotilla::v1::BackendStatus StatusFor(flotilla::v1::TerminationKind kind);

 private:
  std::shared_ptr<db::Repository>     repository_;
  std::shared_ptr<events::EventLog>   events_;
  std::shared_ptr<lock::KeyLockTable> locks_;
  std::shared_ptr<bus::DroneBus>      bus_;
};

} // namespace flotilla::core
