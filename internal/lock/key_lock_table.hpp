#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"

namespace flotilla::events {
class EventLog;
}

namespace flotilla::lock {

enum class KeyLockState {
  kUnheld,
  kHeldHealthy,
  kHeldUnhealthy,
};

struct KeyLockView {
  KeyLockState                        state = KeyLockState::kUnheld;
  std::optional<db::model::KeyLockRecord> lock;
  std::optional<db::model::BackendRecord> holder;
};

/*
  (cluster, key) -> backend holding it.

  A lock row only counts while its backend is non-terminal; a row pointing
  at a Terminated or missing backend reads as unheld and is overwritten by
  the next Bind(). Every method except Release() runs inside the caller's
  transaction so the lock decision commits atomically with the backend row.
*/
class KeyLockTable {
 public:
  KeyLockTable(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventLog> events);

  KeyLockView Inspect(db::Transaction& tx, const std::string& cluster, const std::string& key);

  void Bind(db::Transaction& tx, const std::string& cluster, const std::string& key, const std::string& backend_id, const std::string& tag,
            uint64_t now_ms);

  // Removes the lock only if it still points at `backend_id`.
  bool ReleaseIfHeldBy(db::Transaction& tx, const std::string& cluster, const std::string& key, const std::string& backend_id);

  // Explicit release in its own transaction; throws FailedToRemoveKey.
  void Release(const std::string& cluster, const std::string& key);

  static std::string GenerateTag();

 private:
  void Remove(db::Transaction& tx, const db::model::KeyLockRecord& lock);

  std::shared_ptr<db::Repository>  repository_;
  std::shared_ptr<events::EventLog> events_;
};

} // namespace flotilla::lock
