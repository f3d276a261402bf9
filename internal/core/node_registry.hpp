#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "flotilla/v1.hpp"
#include "internal/db/api/repository.hpp"

namespace flotilla::bus {
class DroneBus;
}

namespace flotilla::events {
class EventLog;
}

namespace flotilla::core {

struct RegisterDroneParams {
  std::string cluster;
  std::string name;
  std::string version;
  std::string build_hash;
};

/*
  Drone membership.

  Drones are fail-stop: once Terminated (explicit shutdown, re-registration
  under the same name, or a missed heartbeat window) they never come back,
  and their non-terminal backends are reported as orphans rather than
  migrated.
*/
class NodeRegistry {
 public:
  NodeRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventLog> events, std::shared_ptr<bus::DroneBus> bus,
               std::string controller_id, uint64_t staleness_ms);

  // Any live drone registered under the same (cluster, name) is terminated first.
  db::model::DroneRecord Register(const RegisterDroneParams& params, uint64_t now_ms);

  // Throws util::NotFound for unknown drones and util::InvalidState for terminated ones.
  void Heartbeat(uint64_t drone_id, uint64_t now_ms);

  // Returns the drone's orphaned backends. Shutting down a terminated drone is a no-op.
  std::vector<db::model::BackendRecord> Shutdown(uint64_t drone_id);

  // Throws util::NotFound when no live drone has that name.
  void Drain(const std::string& cluster, const std::string& name);

  // Terminates drones whose heartbeat is older than the staleness window.
  std::vector<db::model::BackendRecord> SweepStale(uint64_t as_of_ms);

  std::vector<flotilla::v1::DroneInfo> List(const db::DroneFilter& filter);

  std::vector<flotilla::v1::BackendInfo> ListBackends(const db::BackendFilter& filter);

  bool IsStale(const db::model::DroneRecord& drone, uint64_t as_of_ms) const;

  uint64_t staleness_ms() const {
    return staleness_ms_;
  }

  static std::string EventKey(uint64_t drone_id);

  static flotilla::v1::DroneInfo ToProto(const db::model::DroneRecord& record, uint64_t live_backends);

 private:
  std::vector<db::model::BackendRecord> TerminateInTx(db::Transaction& tx, db::model::DroneRecord& drone);

  void ReportOrphans(const db::model::DroneRecord& drone, const std::vector<db::model::BackendRecord>& orphans);

  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<events::EventLog> events_;
  std::shared_ptr<bus::DroneBus>    bus_;
  std::string                       controller_id_;
  uint64_t                          staleness_ms_;
};

} // namespace flotilla::core
