#include "key_lock_table.hpp"

#include "internal/db/api/throw_if_error.hpp"
#include "internal/events/event_log.hpp"
#include "internal/model/backend_state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace flotilla::lock {

namespace {

flotilla::v1::KeyLockEvent ToEvent(const db::model::KeyLockRecord& lock) {
  flotilla::v1::KeyLockEvent event;
  event.set_cluster(lock.cluster);
  event.set_key(lock.key);
  event.set_backend_id(lock.backend_id);
  event.set_tag(lock.tag);
  return event;
}

} // namespace

KeyLockTable::KeyLockTable(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventLog> events)
    : repository_(std::move(repository)), events_(std::move(events)) {
}

std::string KeyLockTable::GenerateTag() {
  return util::RandomToken(8);
}

KeyLockView KeyLockTable::Inspect(db::Transaction& tx, const std::string& cluster, const std::string& key) {
  KeyLockView view;
  view.lock = repository_->GetKeyLock(tx, cluster, key);
  if (!view.lock) return view;

  view.holder = repository_->GetBackend(tx, view.lock->backend_id);
  if (!view.holder || model::IsTerminal(view.holder->status)) {
    view.state = KeyLockState::kUnheld;
    return view;
  }

  if (!model::IsHealthy(view.holder->status)) {
    view.state = KeyLockState::kHeldUnhealthy;
    return view;
  }

  auto drone = repository_->GetDrone(tx, view.holder->drone_id);
  if (!drone || drone->status == flotilla::v1::DRONE_STATUS_TERMINATED) {
    view.state = KeyLockState::kHeldUnhealthy;
    return view;
  }

  view.state = KeyLockState::kHeldHealthy;
  return view;
}

void KeyLockTable::Bind(db::Transaction& tx, const std::string& cluster, const std::string& key, const std::string& backend_id,
                        const std::string& tag, uint64_t now_ms) {
  db::model::KeyLockRecord lock;
  lock.cluster        = cluster;
  lock.key            = key;
  lock.backend_id     = backend_id;
  lock.tag            = tag;
  lock.acquired_at_ms = now_ms;

  db::ThrowIfError(repository_->UpsertKeyLock(tx, lock), "bind key lock");
  events_->Append(tx, events::kind::kKeyAcquired, backend_id, ToEvent(lock));
}

bool KeyLockTable::ReleaseIfHeldBy(db::Transaction& tx, const std::string& cluster, const std::string& key, const std::string& backend_id) {
  auto lock = repository_->GetKeyLock(tx, cluster, key);
  if (!lock || lock->backend_id != backend_id) return false;

  Remove(tx, *lock);
  return true;
}

void KeyLockTable::Remove(db::Transaction& tx, const db::model::KeyLockRecord& lock) {
  db::ThrowIfError(repository_->DeleteKeyLock(tx, lock.cluster, lock.key), "delete key lock");
  events_->Append(tx, events::kind::kKeyReleased, lock.backend_id, ToEvent(lock));
}

void KeyLockTable::Release(const std::string& cluster, const std::string& key) {
  try {
    auto tx   = repository_->Begin();
    auto lock = repository_->GetKeyLock(*tx, cluster, key);
    if (!lock) {
      tx->Commit();
      return;
    }

    Remove(*tx, *lock);
    tx->Commit();
  } catch (const std::exception& e) {
    FLOTILLA_LOG_WARN("key lock release failed", {observability::StringField("cluster", cluster), observability::StringField("key", key),
                                                  observability::StringField("error", e.what())});
    throw util::FailedToRemoveKey();
  }

  events_->NotifyCommitted();
  FLOTILLA_LOG_INFO("key lock released", {observability::StringField("cluster", cluster), observability::StringField("key", key)});
}

} // namespace flotilla::lock
