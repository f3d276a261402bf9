#pragma once

#include "flotilla/v1.hpp"

namespace flotilla::model {

using flotilla::v1::BackendStatus;
using flotilla::v1::DroneStatus;

/*
  Backend status order:

    Scheduled < Starting < Ready < Terminating < HardTerminating < Terminated

  The stored status only moves forward. Reports arrive at least once and in
  any order; a report at or below the stored status is a no-op.
*/

constexpr bool IsTerminal(BackendStatus status) {
  return status == flotilla::v1::BACKEND_STATUS_TERMINATED;
}

constexpr bool IsLive(BackendStatus status) {
  return status != flotilla::v1::BACKEND_STATUS_UNSPECIFIED && !IsTerminal(status);
}

// A holder in one of these states may be handed to a connecting client.
constexpr bool IsHealthy(BackendStatus status) {
  return status == flotilla::v1::BACKEND_STATUS_SCHEDULED || status == flotilla::v1::BACKEND_STATUS_STARTING ||
         status == flotilla::v1::BACKEND_STATUS_READY;
}

constexpr bool ShouldApply(BackendStatus current, BackendStatus incoming) {
  if (incoming == flotilla::v1::BACKEND_STATUS_UNSPECIFIED) {
    return false;
  }
  if (IsTerminal(current)) {
    return false;
  }
  return static_cast<int>(incoming) > static_cast<int>(current);
}

// Terminated drones never come back.
constexpr bool CanTransition(DroneStatus from, DroneStatus to) {
  if (from == flotilla::v1::DRONE_STATUS_TERMINATED) {
    return false;
  }
  if (to == flotilla::v1::DRONE_STATUS_UNSPECIFIED) {
    return false;
  }
  return static_cast<int>(to) >= static_cast<int>(from);
}

} // namespace flotilla::model
