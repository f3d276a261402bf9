#include "drone_bus_service.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <unordered_set>

#include "internal/bus/local_drone_bus.hpp"
#include "internal/core/backend_lifecycle.hpp"
#include "internal/core/backend_registry.hpp"
#include "internal/core/node_registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace flotilla::service {

using namespace flotilla::v1;

namespace {

uint64_t NowMs() {
  return util::NowMillis();
}

// Drone clocks are trusted when set; an unset timestamp means "now".
uint64_t ReportedMs(bool has_time, const google::protobuf::Timestamp& time) {
  if (!has_time) return NowMs();
  return util::ProtoToMillis(time);
}

// Identifies a command for delivery bookkeeping on one stream.
std::string CommandKey(const DroneCommand& command) {
  if (command.has_spawn()) return "spawn:" + command.spawn().backend_id();
  return "terminate:" + TerminationKind_Name(command.terminate().kind()) + ":" + command.terminate().backend_id();
}

} // namespace

DroneBusService::DroneBusService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RegisterDroneResponse DroneBusService::Register(const RegisterDroneRequest& req) {
  return ObserveRpc("DroneBusService.Register", {{"cluster", req.cluster()}, {"drone", req.name()}}, [&] {
    core::RegisterDroneParams params;
    params.cluster    = req.cluster();
    params.name       = req.name();
    params.version    = req.version();
    params.build_hash = req.build_hash();

    RegisterDroneResponse resp;
    resp.set_drone_id(ctx_.nodes->Register(params, NowMs()).id);
    return resp;
  });
}

void DroneBusService::Heartbeat(const DroneRef& req) {
  ObserveRpc("DroneBusService.Heartbeat", {}, [&] { ctx_.nodes->Heartbeat(req.drone_id(), NowMs()); });
}

void DroneBusService::Shutdown(const DroneRef& req) {
  ObserveRpc("DroneBusService.Shutdown", {}, [&] { ctx_.nodes->Shutdown(req.drone_id()); });
}

void DroneBusService::ReportStatus(const StatusReport& req) {
  ObserveRpc("DroneBusService.ReportStatus", {{"backend_id", req.backend_id()}}, [&] {
    if (req.backend_id().empty()) {
      throw std::invalid_argument("status report: backend_id is required");
    }
    if (req.status() == BACKEND_STATUS_UNSPECIFIED) {
      throw std::invalid_argument("status report: status is required");
    }
    ctx_.lifecycle->ApplyStatus(req.backend_id(), req.status(), ReportedMs(req.has_time(), req.time()));
  });
}

void DroneBusService::ReportKeepalive(const KeepaliveReport& req) {
  ObserveRpc("DroneBusService.ReportKeepalive", {{"backend_id", req.backend_id()}}, [&] {
    if (req.backend_id().empty()) {
      throw std::invalid_argument("keepalive: backend_id is required");
    }
    ctx_.backends->Keepalive(req.backend_id(), ReportedMs(req.has_time(), req.time()));
  });
}

std::optional<std::vector<DroneCommand>> DroneBusService::PendingCommands(uint64_t drone_id) {
  db::BackendFilter filter;
  filter.drone_id           = drone_id;
  filter.include_terminated = false;

  auto tx    = ctx_.repository->Begin();
  auto drone = ctx_.repository->GetDrone(*tx, drone_id);
  if (!drone || drone->status == DRONE_STATUS_TERMINATED) {
    tx->Commit();
    return std::nullopt;
  }
  auto backends = ctx_.backends->List(*tx, filter);
  tx->Commit();

  std::vector<DroneCommand> out;
  for (const auto& backend : backends) {
    DroneCommand command;
    switch (backend.status) {
      case BACKEND_STATUS_SCHEDULED: {
        auto* spawn = command.mutable_spawn();
        spawn->set_backend_id(backend.id);
        spawn->set_cluster(backend.cluster);
        spawn->set_drone_id(drone_id);
        *spawn->mutable_spawn_config() = core::BackendRegistry::SpawnConfigOf(backend);
        break;
      }
      case BACKEND_STATUS_TERMINATING:
        command.mutable_terminate()->set_backend_id(backend.id);
        command.mutable_terminate()->set_kind(TERMINATION_KIND_SOFT);
        break;
      case BACKEND_STATUS_HARD_TERMINATING:
        command.mutable_terminate()->set_backend_id(backend.id);
        command.mutable_terminate()->set_kind(TERMINATION_KIND_HARD);
        break;
      default:
        continue;
    }
    out.push_back(std::move(command));
  }
  return out;
}

void DroneBusService::Attach(const DroneRef& req, const StreamSink<DroneCommand>& sink, const CancelCheck& cancelled) {
  ObserveRpc("DroneBusService.Attach", {}, [&] {
    const auto drone_id = req.drone_id();
    {
      auto tx    = ctx_.repository->Begin();
      auto drone = ctx_.repository->GetDrone(*tx, drone_id);
      tx->Commit();
      if (!drone) {
        throw util::NotFound("drone " + std::to_string(drone_id) + " not found");
      }
      if (drone->status == DRONE_STATUS_TERMINATED) {
        throw util::InvalidState("drone " + std::to_string(drone_id) + " is terminated");
      }
    }

    auto mailbox = ctx_.bus->Attach(drone_id);
    FLOTILLA_LOG_INFO("drone attached", {observability::UintField("drone_id", drone_id), observability::UintField("pending", mailbox->Size())});

    std::unordered_set<std::string> delivered;
    const auto deliver = [&](const DroneCommand& command) {
      const auto key = CommandKey(command);
      if (delivered.contains(key)) return true;
      if (!sink(command)) return false;
      delivered.insert(key);
      FLOTILLA_LOG_DEBUG("command delivered", {observability::UintField("drone_id", drone_id), observability::StringField("command", key)});
      return true;
    };

    auto next_resync = std::chrono::steady_clock::now();
    while (!cancelled()) {
      if (std::chrono::steady_clock::now() >= next_resync) {
        auto pending = PendingCommands(drone_id);
        if (!pending) break;

        bool sent_all = true;
        for (const auto& command : *pending) {
          if (!deliver(command)) {
            sent_all = false;
            break;
          }
        }
        if (!sent_all) break;
        next_resync = std::chrono::steady_clock::now() + kStoreResyncInterval;
      }

      auto command = mailbox->Dequeue(kCommandPollInterval);
      if (!command) {
        if (mailbox->IsShutdown()) break;
        continue;
      }
      if (!deliver(*command)) {
        mailbox->Requeue(*command);
        break;
      }
    }

    FLOTILLA_LOG_INFO("drone detached", {observability::UintField("drone_id", drone_id)});
  });
}

} // namespace flotilla::service
