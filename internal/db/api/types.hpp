#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace flotilla::db {

struct DroneFilter {
  std::optional<std::string> cluster;
  bool                       include_terminated = true;
};

struct BackendFilter {
  std::optional<std::string> cluster;
  std::optional<uint64_t>    drone_id;
  bool                       include_terminated = true;
};

} // namespace flotilla::db
