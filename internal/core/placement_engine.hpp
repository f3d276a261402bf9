#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace flotilla::core {

/*
  Stateless drone selection.

  A drone is eligible when it is Available, not draining, belongs to the
  requested cluster and heartbeated within the staleness window. Among the
  eligible drones the one with the fewest live backends wins; ties go to
  the smallest drone id.
*/
class PlacementEngine {
public:
  static bool IsEligible(const db::model::DroneRecord& drone, const std::string& cluster, uint64_t as_of_ms, uint64_t staleness_ms);

  static std::optional<db::model::DroneRecord> SelectDrone(const std::vector<db::model::DroneRecord>& drones,
                                                           const std::unordered_map<uint64_t, uint64_t>& live_backends,
                                                           const std::string& cluster, uint64_t as_of_ms, uint64_t staleness_ms);

  // Loads drones and their live backend counts inside `tx`.
  static std::optional<db::model::DroneRecord> SelectDrone(db::Repository& repository, db::Transaction& tx, const std::string& cluster,
                                                           uint64_t as_of_ms, uint64_t staleness_ms);

  static std::unordered_map<uint64_t, uint64_t> CountLiveBackends(const std::vector<db::model::BackendRecord>& backends);
};

}
