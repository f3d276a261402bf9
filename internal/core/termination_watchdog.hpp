#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "flotilla/v1.hpp"
#include "internal/db/api/repository.hpp"

namespace flotilla::core {

class BackendLifecycle;

struct TerminationCandidate {
  db::model::BackendRecord backend;
  bool                     expired = false;
  bool                     idle    = false;
  // Seconds idle beyond allowed_idle_seconds; 0 unless idle.
  int64_t idle_overage_seconds = 0;
};

struct WatchdogStats {
  uint64_t soft_terminated = 0;
  uint64_t hard_terminated = 0;
  uint64_t failed          = 0;
};

/*
  Expiration and idle enforcement.

  Both checks are strict: a backend whose expiration equals as_of, or that
  has been idle for exactly allowed_idle_seconds, is not a candidate.
*/
class TerminationWatchdog {
 public:
  TerminationWatchdog(std::shared_ptr<db::Repository> repository, std::shared_ptr<BackendLifecycle> lifecycle, uint32_t hard_terminate_grace_seconds);

  static std::optional<TerminationCandidate> Evaluate(const db::model::BackendRecord& backend, uint64_t as_of_ms);

  std::vector<TerminationCandidate> Candidates(uint64_t as_of_ms, const db::BackendFilter& filter);

  // Resolves a drone name to its live id before listing; throws util::NotFound.
  std::vector<TerminationCandidate> Candidates(uint64_t as_of_ms, const std::string& cluster, const std::string& drone_name);

  WatchdogStats Sweep(uint64_t as_of_ms);

  static flotilla::services::v1::TerminationCandidate ToProto(const TerminationCandidate& candidate, uint64_t as_of_ms);

 private:
  bool ShouldEscalate(const db::model::BackendRecord& backend, uint64_t as_of_ms) const;

  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<BackendLifecycle> lifecycle_;
  uint32_t                          grace_seconds_;
};

} // namespace flotilla::core
