#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "flotilla/v1.hpp"

namespace flotilla::db::model {

struct BackendRecord {
  std::string id;
  std::string cluster;
  uint64_t    drone_id = 0;

  flotilla::v1::BackendStatus status = flotilla::v1::BACKEND_STATUS_SCHEDULED;

  uint64_t last_status_ms    = 0;
  uint64_t last_keepalive_ms = 0;

  std::optional<uint64_t> expiration_ms;
  std::optional<uint64_t> allowed_idle_seconds;

  // SpawnConfig in its canonical JSON mapping
  std::string spawn_config_json;

  // empty when the backend was spawned without a key
  std::string key;
};

} // namespace flotilla::db::model
