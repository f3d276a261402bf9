#include "backend_lifecycle.hpp"

#include "internal/bus/drone_bus.hpp"
#include "internal/db/api/throw_if_error.hpp"
#include "internal/events/event_log.hpp"
#include "internal/lock/key_lock_table.hpp"
#include "internal/model/backend_state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace flotilla::core {

BackendLifecycle::BackendLifecycle(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventLog> events,
                                   std::shared_ptr<lock::KeyLockTable> locks, std::shared_ptr<bus::DroneBus> bus)
    : repository_(std::move(repository)), events_(std::move(events)), locks_(std::move(locks)), bus_(std::move(bus)) {
}

flotilla::v1::BackendStatus BackendLifecycle::StatusFor(flotilla::v1::TerminationKind kind) {
  return kind == flotilla::v1::TERMINATION_KIND_HARD ? flotilla::v1::BACKEND_STATUS_HARD_TERMINATING : flotilla::v1::BACKEND_STATUS_TERMINATING;
}

bool BackendLifecycle::ApplyStatus(const std::string& backend_id, flotilla::v1::BackendStatus status, uint64_t time_ms) {
  auto tx      = repository_->Begin();
  auto backend = repository_->GetBackend(*tx, backend_id);
  if (!backend) {
    throw util::NotFound("backend '" + backend_id + "' not found");
  }

  const bool applied = ApplyStatusInTx(*tx, *backend, status, time_ms);
  tx->Commit();

  if (applied) {
    events_->NotifyCommitted();
  }
  return applied;
}

bool BackendLifecycle::ApplyStatusInTx(db::Transaction& tx, db::model::BackendRecord& backend, flotilla::v1::BackendStatus status,
                                       uint64_t time_ms) {
  if (!model::ShouldApply(backend.status, status)) {
    return false;
  }

  backend.status         = status;
  backend.last_status_ms = time_ms;
  db::ThrowIfError(repository_->UpdateBackend(tx, backend), "update backend status");

  flotilla::v1::BackendStatusUpdate update;
  update.set_backend_id(backend.id);
  update.set_status(status);
  *update.mutable_time() = util::MillisToProto(time_ms);
  events_->Append(tx, events::kind::kBackendStatus, backend.id, update);

  if (model::IsTerminal(status) && !backend.key.empty()) {
    locks_->ReleaseIfHeldBy(tx, backend.cluster, backend.key, backend.id);
  }

  observability::Metrics::Instance().RecordBackendTransition(backend.cluster, flotilla::v1::BackendStatus_Name(status));
  return true;
}

bool BackendLifecycle::Terminate(const std::string& backend_id, flotilla::v1::TerminationKind kind, uint64_t now_ms) {
  auto tx      = repository_->Begin();
  auto backend = repository_->GetBackend(*tx, backend_id);
  if (!backend) {
    throw util::NotFound("backend '" + backend_id + "' not found");
  }

  // No drone will ever report for an orphan, so it is finished here.
  const auto drone    = repository_->GetDrone(*tx, backend->drone_id);
  const bool orphaned = !drone || drone->status == flotilla::v1::DRONE_STATUS_TERMINATED;
  const auto target   = orphaned ? flotilla::v1::BACKEND_STATUS_TERMINATED : StatusFor(kind);

  if (!ApplyStatusInTx(*tx, *backend, target, now_ms)) {
    tx->Commit();
    return false;
  }
  tx->Commit();
  events_->NotifyCommitted();

  if (orphaned) {
    FLOTILLA_LOG_WARN("orphaned backend force-terminated", {observability::StringField("backend_id", backend->id),
                                                            observability::UintField("drone_id", backend->drone_id)});
    return true;
  }

  flotilla::v1::TerminateCommand command;
  command.set_backend_id(backend->id);
  command.set_kind(kind == flotilla::v1::TERMINATION_KIND_HARD ? kind : flotilla::v1::TERMINATION_KIND_SOFT);
  bus_->SendTerminate(backend->drone_id, command);

  FLOTILLA_LOG_INFO("backend terminate requested", {observability::StringField("backend_id", backend->id),
                                                    observability::UintField("drone_id", backend->drone_id),
                                                    observability::StringField("kind", flotilla::v1::TerminationKind_Name(command.kind()))});
  return true;
}

} // namespace flotilla::core
