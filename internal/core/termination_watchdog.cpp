#include "termination_watchdog.hpp"

#include <stdexcept>

#include "backend_lifecycle.hpp"
#include "internal/model/backend_state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace flotilla::core {

TerminationWatchdog::TerminationWatchdog(std::shared_ptr<db::Repository> repository, std::shared_ptr<BackendLifecycle> lifecycle,
                                         uint32_t hard_terminate_grace_seconds)
    : repository_(std::move(repository)), lifecycle_(std::move(lifecycle)), grace_seconds_(hard_terminate_grace_seconds) {
}

std::optional<TerminationCandidate> TerminationWatchdog::Evaluate(const db::model::BackendRecord& backend, uint64_t as_of_ms) {
  if (!model::IsLive(backend.status)) return std::nullopt;

  TerminationCandidate candidate;
  candidate.backend = backend;
  candidate.expired = backend.expiration_ms.has_value() && *backend.expiration_ms < as_of_ms;

  if (backend.allowed_idle_seconds && as_of_ms > backend.last_keepalive_ms) {
    const uint64_t idle_ms    = as_of_ms - backend.last_keepalive_ms;
    const uint64_t allowed_ms = static_cast<uint64_t>(*backend.allowed_idle_seconds) * 1000;
    if (idle_ms > allowed_ms) {
      // rounded up so any overage reads as at least one second
      candidate.idle                 = true;
      candidate.idle_overage_seconds = static_cast<int64_t>((idle_ms - allowed_ms + 999) / 1000);
    }
  }

  if (!candidate.expired && !candidate.idle) return std::nullopt;
  return candidate;
}

std::vector<TerminationCandidate> TerminationWatchdog::Candidates(uint64_t as_of_ms, const db::BackendFilter& filter) {
  db::BackendFilter live = filter;
  live.include_terminated = false;

  auto tx       = repository_->Begin();
  auto backends = repository_->ListBackends(*tx, live);
  tx->Commit();

  std::vector<TerminationCandidate> out;
  for (const auto& backend : backends) {
    if (auto candidate = Evaluate(backend, as_of_ms)) out.push_back(std::move(*candidate));
  }
  return out;
}

std::vector<TerminationCandidate> TerminationWatchdog::Candidates(uint64_t as_of_ms, const std::string& cluster, const std::string& drone_name) {
  db::BackendFilter filter;
  if (!cluster.empty()) filter.cluster = cluster;

  if (!drone_name.empty()) {
    if (cluster.empty()) {
      throw std::invalid_argument("drone filter requires a cluster");
    }
    auto tx    = repository_->Begin();
    auto drone = repository_->GetLiveDroneByName(*tx, cluster, drone_name);
    tx->Commit();
    if (!drone) {
      throw util::NotFound("no live drone '" + drone_name + "' in cluster '" + cluster + "'");
    }
    filter.drone_id = drone->id;
  }
  return Candidates(as_of_ms, filter);
}

bool TerminationWatchdog::ShouldEscalate(const db::model::BackendRecord& backend, uint64_t as_of_ms) const {
  if (grace_seconds_ == 0) return false;
  if (backend.status != flotilla::v1::BACKEND_STATUS_TERMINATING) return false;
  return backend.last_status_ms + static_cast<uint64_t>(grace_seconds_) * 1000 < as_of_ms;
}

WatchdogStats TerminationWatchdog::Sweep(uint64_t as_of_ms) {
  observability::SpanScope span("watchdog.sweep");

  db::BackendFilter filter;
  filter.include_terminated = false;

  auto tx       = repository_->Begin();
  auto backends = repository_->ListBackends(*tx, filter);
  tx->Commit();

  WatchdogStats stats;
  for (const auto& backend : backends) {
    try {
      if (ShouldEscalate(backend, as_of_ms)) {
        if (lifecycle_->Terminate(backend.id, flotilla::v1::TERMINATION_KIND_HARD, as_of_ms)) {
          ++stats.hard_terminated;
          observability::Metrics::Instance().RecordWatchdogTermination("hard");
          FLOTILLA_LOG_WARN("backend did not stop within grace, escalating to hard terminate",
                            {observability::StringField("backend_id", backend.id), observability::IntField("grace_seconds", grace_seconds_)});
        }
        continue;
      }

      if (!model::IsHealthy(backend.status)) continue;

      const auto candidate = Evaluate(backend, as_of_ms);
      if (!candidate) continue;

      if (lifecycle_->Terminate(backend.id, flotilla::v1::TERMINATION_KIND_SOFT, as_of_ms)) {
        ++stats.soft_terminated;
        observability::Metrics::Instance().RecordWatchdogTermination("soft");
        FLOTILLA_LOG_INFO("watchdog terminating backend", {observability::StringField("backend_id", backend.id),
                                                           observability::BoolField("expired", candidate->expired),
                                                           observability::IntField("idle_overage_seconds", candidate->idle_overage_seconds)});
      }
    } catch (const std::exception& e) {
      ++stats.failed;
      FLOTILLA_LOG_ERROR("watchdog terminate failed", {observability::StringField("backend_id", backend.id), observability::StringField("error", e.what())});
    }
  }

  span.SetAttribute("soft_terminated", static_cast<std::int64_t>(stats.soft_terminated));
  span.SetAttribute("hard_terminated", static_cast<std::int64_t>(stats.hard_terminated));
  return stats;
}

flotilla::services::v1::TerminationCandidate TerminationWatchdog::ToProto(const TerminationCandidate& candidate, uint64_t as_of_ms) {
  flotilla::services::v1::TerminationCandidate out;
  out.set_backend_id(candidate.backend.id);
  *out.mutable_as_of() = util::MillisToProto(as_of_ms);
  if (candidate.backend.expiration_ms) {
    *out.mutable_expiration_time() = util::MillisToProto(*candidate.backend.expiration_ms);
  }
  if (candidate.backend.allowed_idle_seconds) {
    out.set_allowed_idle_seconds(static_cast<uint32_t>(*candidate.backend.allowed_idle_seconds));
  }
  *out.mutable_last_keepalive() = util::MillisToProto(candidate.backend.last_keepalive_ms);
  out.set_expired(candidate.expired);
  out.set_idle_overage_seconds(candidate.idle_overage_seconds);
  return out;
}

} // namespace flotilla::core
