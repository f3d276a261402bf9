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

class BackendRegistry;

struct ConnectSettings {
  std::string default_cluster;
  std::string url_scheme   = "https";
  uint64_t    staleness_ms = 30000;
};

/*
  Connect: return the backend holding a key, or place and spawn a new one.

  The lock decision, the backend row and the lock row commit in one
  transaction. The spawn command is dispatched only after the commit, so a
  failed connect (no drone, lost race) leaves no trace in the store and
  nothing on the bus.
*/
class ConnectProtocol {
 public:
  ConnectProtocol(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventLog> events, std::shared_ptr<lock::KeyLockTable> locks,
                  std::shared_ptr<BackendRegistry> backends, std::shared_ptr<bus::DroneBus> bus, ConnectSettings settings);

  flotilla::v1::ConnectResponse Connect(const flotilla::v1::ConnectRequest& request, uint64_t now_ms);

  std::string BackendUrl(const std::string& backend_id, const std::string& cluster) const;

  const ConnectSettings& settings() const {
    return settings_;
  }

 private:
  flotilla::v1::ConnectResponse ConnectInTx(db::Transaction& tx, const std::string& cluster, const flotilla::v1::ConnectRequest& request,
                                            uint64_t now_ms, flotilla::v1::SpawnCommand& spawn);

  std::shared_ptr<db::Repository>     repository_;
  std::shared_ptr<events::EventLog>   events_;
  std::shared_ptr<lock::KeyLockTable> locks_;
  std::shared_ptr<BackendRegistry>    backends_;
  std::shared_ptr<bus::DroneBus>      bus_;
  ConnectSettings                     settings_;
};

} // namespace flotilla::core
