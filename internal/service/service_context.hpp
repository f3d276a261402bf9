#pragma once

#include <memory>

namespace flotilla::db {
class Repository;
}
namespace flotilla::events {
class EventLog;
}
namespace flotilla::lock {
class KeyLockTable;
}
namespace flotilla::bus {
class LocalDroneBus;
}
namespace flotilla::core {
class BackendRegistry;
class BackendLifecycle;
class NodeRegistry;
class TerminationWatchdog;
class ConnectProtocol;
} // namespace flotilla::core

namespace flotilla::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<flotilla::db::Repository>            repository;
  std::shared_ptr<flotilla::events::EventLog>          events;
  std::shared_ptr<flotilla::lock::KeyLockTable>        locks;
  std::shared_ptr<flotilla::bus::LocalDroneBus>        bus;
  std::shared_ptr<flotilla::core::BackendRegistry>     backends;
  std::shared_ptr<flotilla::core::BackendLifecycle>    lifecycle;
  std::shared_ptr<flotilla::core::NodeRegistry>        nodes;
  std::shared_ptr<flotilla::core::TerminationWatchdog> watchdog;
  std::shared_ptr<flotilla::core::ConnectProtocol>     connect;
};

} // namespace flotilla::service
