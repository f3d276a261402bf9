#include "controller_service.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/core/backend_lifecycle.hpp"
#include "internal/core/backend_registry.hpp"
#include "internal/core/connect_protocol.hpp"
#include "internal/core/node_registry.hpp"
#include "internal/core/termination_watchdog.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_log.hpp"
#include "internal/lock/key_lock_table.hpp"
#include "internal/model/backend_state_machine.hpp"
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

std::optional<std::string> OptionalCluster(const std::string& cluster) {
  if (cluster.empty()) return std::nullopt;
  return cluster;
}

std::optional<BackendStatusUpdate> ParseStatusUpdate(const Event& event) {
  BackendStatusUpdate update;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  const auto status = google::protobuf::util::JsonStringToMessage(event.payload_json(), &update, options);
  if (!status.ok()) {
    FLOTILLA_LOG_WARN("skipping malformed backend_status event",
                      {observability::UintField("event_id", event.id()), observability::StringField("error", std::string(status.message()))});
    return std::nullopt;
  }
  return update;
}

} // namespace

ControllerService::ControllerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ConnectResponse ControllerService::Connect(const ConnectRequest& req) {
  return ObserveRpc("ControllerService.Connect", {{"cluster", req.cluster()}, {"key", req.key().name()}},
                    [&] { return ctx_.connect->Connect(req, NowMs()); });
}

void ControllerService::Terminate(const TerminateRequest& req) {
  ObserveRpc("ControllerService.Terminate", {{"backend_id", req.backend_id()}}, [&] {
    if (req.backend_id().empty()) {
      throw std::invalid_argument("terminate: backend_id is required");
    }
    ctx_.lifecycle->Terminate(req.backend_id(), req.kind(), NowMs());
  });
}

void ControllerService::Drain(const DrainRequest& req) {
  ObserveRpc("ControllerService.Drain", {{"cluster", req.cluster()}, {"drone", req.drone()}}, [&] {
    const std::string cluster = req.cluster().empty() ? ctx_.connect->settings().default_cluster : req.cluster();
    if (cluster.empty()) {
      throw util::NoClusterProvided();
    }
    if (req.drone().empty()) {
      throw std::invalid_argument("drain: drone name is required");
    }
    ctx_.nodes->Drain(cluster, req.drone());
  });
}

void ControllerService::ReleaseKey(const ReleaseKeyRequest& req) {
  ObserveRpc("ControllerService.ReleaseKey", {{"cluster", req.cluster()}, {"key", req.key()}}, [&] {
    const std::string cluster = req.cluster().empty() ? ctx_.connect->settings().default_cluster : req.cluster();
    if (cluster.empty()) {
      throw util::NoClusterProvided();
    }
    if (req.key().empty()) {
      throw std::invalid_argument("release key: key is required");
    }
    ctx_.locks->Release(cluster, req.key());
  });
}

ListDronesResponse ControllerService::ListDrones(const ListDronesRequest& req) {
  return ObserveRpc("ControllerService.ListDrones", {{"cluster", req.cluster()}}, [&] {
    db::DroneFilter filter;
    filter.cluster            = OptionalCluster(req.cluster());
    filter.include_terminated = req.include_terminated();

    ListDronesResponse resp;
    for (auto& drone : ctx_.nodes->List(filter)) {
      *resp.add_drones() = std::move(drone);
    }
    return resp;
  });
}

ListBackendsResponse ControllerService::ListBackends(const ListBackendsRequest& req) {
  return ObserveRpc("ControllerService.ListBackends", {{"cluster", req.cluster()}}, [&] {
    db::BackendFilter filter;
    filter.cluster            = OptionalCluster(req.cluster());
    filter.include_terminated = req.include_terminated();

    ListBackendsResponse resp;
    for (auto& backend : ctx_.nodes->ListBackends(filter)) {
      *resp.add_backends() = std::move(backend);
    }
    return resp;
  });
}

TerminationCandidatesResponse ControllerService::TerminationCandidates(const TerminationCandidatesRequest& req) {
  return ObserveRpc("ControllerService.TerminationCandidates", {{"cluster", req.cluster()}, {"drone", req.drone()}}, [&] {
    const auto as_of = NowMs();

    TerminationCandidatesResponse resp;
    for (const auto& candidate : ctx_.watchdog->Candidates(as_of, req.cluster(), req.drone())) {
      *resp.add_candidates() = core::TerminationWatchdog::ToProto(candidate, as_of);
    }
    return resp;
  });
}

void ControllerService::WatchBackend(const WatchBackendRequest& req, const StreamSink<BackendStatusUpdate>& sink, const CancelCheck& cancelled) {
  ObserveRpc("ControllerService.WatchBackend", {{"backend_id", req.backend_id()}}, [&] {
    events::SubscriptionOptions options;
    options.after_id = ctx_.events->LatestId();
    options.key      = req.backend_id();
    auto subscription = ctx_.events->Subscribe(options);

    // Snapshot after the cursor was taken, so nothing between the two is lost.
    auto tx      = ctx_.repository->Begin();
    auto backend = ctx_.backends->Require(*tx, req.backend_id());
    tx->Commit();

    BackendStatusUpdate current;
    current.set_backend_id(backend.id);
    current.set_status(backend.status);
    *current.mutable_time() = util::MillisToProto(backend.last_status_ms);
    if (!sink(current) || model::IsTerminal(backend.status)) return;

    auto last_sent = backend.status;
    while (!cancelled()) {
      auto batch = subscription->Next(kStreamPollInterval);
      if (!batch) return;

      for (const auto& event : *batch) {
        if (event.kind() != events::kind::kBackendStatus) continue;

        auto update = ParseStatusUpdate(event);
        if (!update || !model::ShouldApply(last_sent, update->status())) continue;

        if (!sink(*update)) return;
        last_sent = update->status();
        if (model::IsTerminal(last_sent)) return;
      }
    }
  });
}

void ControllerService::WatchEvents(const WatchEventsRequest& req, const StreamSink<Event>& sink, const CancelCheck& cancelled) {
  ObserveRpc("ControllerService.WatchEvents", {}, [&] {
    events::SubscriptionOptions options;
    options.after_id = req.from_latest() ? ctx_.events->LatestId() : req.after_id();
    auto subscription = ctx_.events->Subscribe(options);

    while (!cancelled()) {
      auto batch = subscription->Next(kStreamPollInterval);
      if (!batch) return;

      for (const auto& event : *batch) {
        if (!sink(event)) return;
      }
    }
  });
}

} // namespace flotilla::service
