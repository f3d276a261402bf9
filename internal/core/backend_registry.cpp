#include "backend_registry.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/db/api/throw_if_error.hpp"
#include "internal/events/event_log.hpp"
#include "internal/model/backend_state_machine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace flotilla::core {

BackendRegistry::BackendRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventLog> events)
    : repository_(std::move(repository)), events_(std::move(events)) {
}

db::model::BackendRecord BackendRegistry::Create(db::Transaction& tx, const std::string& cluster, uint64_t drone_id,
                                                 const flotilla::v1::SpawnConfig& spawn_config, const std::string& key, uint64_t now_ms) {
  db::model::BackendRecord record;
  record.id                = util::NewUuid();
  record.cluster           = cluster;
  record.drone_id          = drone_id;
  record.status            = flotilla::v1::BACKEND_STATUS_SCHEDULED;
  record.last_status_ms    = now_ms;
  record.last_keepalive_ms = now_ms;
  record.key               = key;

  if (spawn_config.has_lifetime_limit_seconds()) {
    record.expiration_ms = now_ms + static_cast<uint64_t>(spawn_config.lifetime_limit_seconds()) * 1000;
  }
  if (spawn_config.has_max_idle_seconds()) {
    record.allowed_idle_seconds = spawn_config.max_idle_seconds();
  }

  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  const auto status = google::protobuf::util::MessageToJsonString(spawn_config, &record.spawn_config_json, options);
  if (!status.ok()) {
    throw std::runtime_error("spawn config serialization failed: " + std::string(status.message()));
  }

  db::ThrowIfError(repository_->InsertBackend(tx, record), "insert backend");

  flotilla::v1::BackendStatusUpdate update;
  update.set_backend_id(record.id);
  update.set_status(record.status);
  *update.mutable_time() = util::MillisToProto(now_ms);
  events_->Append(tx, events::kind::kBackendStatus, record.id, update);

  return record;
}

std::optional<db::model::BackendRecord> BackendRegistry::Get(db::Transaction& tx, const std::string& backend_id) {
  return repository_->GetBackend(tx, backend_id);
}

db::model::BackendRecord BackendRegistry::Require(db::Transaction& tx, const std::string& backend_id) {
  auto record = repository_->GetBackend(tx, backend_id);
  if (!record) {
    throw util::NotFound("backend '" + backend_id + "' not found");
  }
  return *record;
}

std::vector<db::model::BackendRecord> BackendRegistry::List(db::Transaction& tx, const db::BackendFilter& filter) {
  return repository_->ListBackends(tx, filter);
}

void BackendRegistry::Keepalive(const std::string& backend_id, uint64_t time_ms) {
  auto tx     = repository_->Begin();
  auto record = Require(*tx, backend_id);
  if (model::IsTerminal(record.status) || time_ms <= record.last_keepalive_ms) {
    tx->Commit();
    return;
  }

  record.last_keepalive_ms = time_ms;
  db::ThrowIfError(repository_->UpdateBackend(*tx, record), "update backend keepalive");
  tx->Commit();
}

flotilla::v1::SpawnConfig BackendRegistry::SpawnConfigOf(const db::model::BackendRecord& record) {
  flotilla::v1::SpawnConfig config;
  if (record.spawn_config_json.empty()) return config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  const auto status = google::protobuf::util::JsonStringToMessage(record.spawn_config_json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("stored spawn config for backend '" + record.id + "' is invalid: " + std::string(status.message()));
  }
  return config;
}

flotilla::v1::BackendInfo BackendRegistry::ToProto(const db::model::BackendRecord& record, bool orphaned) {
  flotilla::v1::BackendInfo info;
  info.set_id(record.id);
  info.set_cluster(record.cluster);
  info.set_drone_id(record.drone_id);
  info.set_status(record.status);
  *info.mutable_last_status_time() = util::MillisToProto(record.last_status_ms);
  *info.mutable_last_keepalive()   = util::MillisToProto(record.last_keepalive_ms);
  if (record.expiration_ms) {
    *info.mutable_expiration_time() = util::MillisToProto(*record.expiration_ms);
  }
  if (record.allowed_idle_seconds) {
    info.set_allowed_idle_seconds(static_cast<uint32_t>(*record.allowed_idle_seconds));
  }
  info.set_key(record.key);
  info.set_orphaned(orphaned);
  return info;
}

} // namespace flotilla::core
