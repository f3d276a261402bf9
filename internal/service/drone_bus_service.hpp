#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <vector>

#include "flotilla/v1.hpp"
#include "controller_service.hpp"
#include "service_context.hpp"

namespace flotilla::service {

/*
  Drone-facing API: membership, status and keepalive reports, and the
  command stream.
*/
class DroneBusService {
 public:
  static constexpr std::chrono::milliseconds kCommandPollInterval{250};
  static constexpr std::chrono::milliseconds kStoreResyncInterval{5000};

  explicit DroneBusService(ServiceContext ctx);

  flotilla::v1::RegisterDroneResponse Register(const flotilla::v1::RegisterDroneRequest& req);

  void Heartbeat(const flotilla::v1::DroneRef& req);
  void Shutdown(const flotilla::v1::DroneRef& req);

  void ReportStatus(const flotilla::v1::StatusReport& req);
  void ReportKeepalive(const flotilla::v1::KeepaliveReport& req);

  /*
    Streams the drone's commands until the sink fails, `cancelled` turns
    true, the drone is terminated, or another Attach for the same drone
    takes over.

    Commands are rebuilt from the store first and again every
    kStoreResyncInterval: a spawn for each backend still Scheduled and a
    terminate for each backend Terminating or HardTerminating. Commands
    issued by other controller instances, or lost with a restarted one,
    reach the drone that way. Each command is sent at most once per
    stream. A mailbox command the sink could not deliver stays queued for
    the next Attach.
  */
  void Attach(const flotilla::v1::DroneRef& req, const StreamSink<flotilla::v1::DroneCommand>& sink, const CancelCheck& cancelled);

 private:
  // Commands implied by the stored state of the drone's backends, or
  // nullopt once the drone is gone or terminated.
  std::optional<std::vector<flotilla::v1::DroneCommand>> PendingCommands(uint64_t drone_id);

  ServiceContext ctx_;
};

} // namespace flotilla::service
