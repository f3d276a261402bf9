#pragma once

#include <cstdint>
#include <string>

#include "flotilla/v1.hpp"

namespace flotilla::db::model {

struct DroneRecord {
  uint64_t    id = 0;
  std::string cluster;
  std::string name;
  std::string controller;
  std::string version;
  std::string build_hash;

  flotilla::v1::DroneStatus status = flotilla::v1::DRONE_STATUS_STARTING;

  uint64_t last_heartbeat_ms = 0;
  bool     draining          = false;
};

} // namespace flotilla::db::model
