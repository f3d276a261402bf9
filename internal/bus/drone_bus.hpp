#pragma once

#include <cstdint>

#include "flotilla/v1.hpp"

namespace flotilla::bus {

/*
  Controller -> drone command channel.

  Fire-and-forget, at-least-once, unordered. Drones must treat a repeated
  spawn for the same backend id as a no-op, and the controller never
  waits for a command to be executed; the effect is observed later as a
  status report.
*/
class DroneBus {
 public:
  virtual ~DroneBus() = default;

  virtual void SendSpawn(uint64_t drone_id, const flotilla::v1::SpawnCommand& command) = 0;

  virtual void SendTerminate(uint64_t drone_id, const flotilla::v1::TerminateCommand& command) = 0;

  // Drops pending commands for a drone that will never attach again.
  virtual void CloseDrone(uint64_t drone_id) = 0;
};

} // namespace flotilla::bus
