#include "grpc_error.hpp"

#include <stdexcept>

#include "internal/db/api/transaction.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace flotilla::grpc {

using namespace flotilla::util;

flotilla::v1::ErrorInfo ToErrorInfo(const std::exception& e, ::grpc::StatusCode* code) {
  flotilla::v1::ErrorInfo info;
  info.set_message(e.what());

  const auto set = [&](flotilla::v1::ErrorKind kind, ::grpc::StatusCode status) {
    info.set_kind(kind);
    *code = status;
  };

  if (dynamic_cast<const NoClusterProvided*>(&e)) {
    set(flotilla::v1::ERROR_KIND_NO_CLUSTER_PROVIDED, ::grpc::StatusCode::INVALID_ARGUMENT);
  } else if (dynamic_cast<const KeyUnheldNoSpawnConfig*>(&e)) {
    set(flotilla::v1::ERROR_KIND_KEY_UNHELD_NO_SPAWN_CONFIG, ::grpc::StatusCode::FAILED_PRECONDITION);
  } else if (const auto* held = dynamic_cast<const KeyHeld*>(&e)) {
    set(flotilla::v1::ERROR_KIND_KEY_HELD, ::grpc::StatusCode::ALREADY_EXISTS);
    info.set_existing_tag(held->existing_tag());
  } else if (dynamic_cast<const KeyHeldUnhealthy*>(&e)) {
    set(flotilla::v1::ERROR_KIND_KEY_HELD_UNHEALTHY, ::grpc::StatusCode::UNAVAILABLE);
  } else if (dynamic_cast<const NoDroneAvailable*>(&e)) {
    set(flotilla::v1::ERROR_KIND_NO_DRONE_AVAILABLE, ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  } else if (dynamic_cast<const FailedToAcquireKey*>(&e)) {
    set(flotilla::v1::ERROR_KIND_FAILED_TO_ACQUIRE_KEY, ::grpc::StatusCode::ABORTED);
  } else if (dynamic_cast<const db::TransactionConflict*>(&e)) {
    set(flotilla::v1::ERROR_KIND_OTHER, ::grpc::StatusCode::ABORTED);
    info.set_message("Concurrent update, retry the request.");
    FLOTILLA_LOG_WARN("transaction conflict", {observability::StringField("error", e.what())});
  } else if (dynamic_cast<const FailedToRemoveKey*>(&e)) {
    set(flotilla::v1::ERROR_KIND_FAILED_TO_REMOVE_KEY, ::grpc::StatusCode::ABORTED);
  } else if (dynamic_cast<const NotFound*>(&e)) {
    set(flotilla::v1::ERROR_KIND_NOT_FOUND, ::grpc::StatusCode::NOT_FOUND);
  } else if (dynamic_cast<const InvalidState*>(&e)) {
    set(flotilla::v1::ERROR_KIND_INVALID_STATE, ::grpc::StatusCode::FAILED_PRECONDITION);
  } else if (dynamic_cast<const AlreadyExists*>(&e)) {
    set(flotilla::v1::ERROR_KIND_OTHER, ::grpc::StatusCode::ALREADY_EXISTS);
  } else if (dynamic_cast<const std::invalid_argument*>(&e)) {
    set(flotilla::v1::ERROR_KIND_OTHER, ::grpc::StatusCode::INVALID_ARGUMENT);
  } else {
    set(flotilla::v1::ERROR_KIND_OTHER, ::grpc::StatusCode::INTERNAL);
    info.set_error_id(RandomToken(8));
    info.set_message("internal error (error id " + info.error_id() + ")");
    FLOTILLA_LOG_ERROR("internal error", {observability::StringField("error_id", info.error_id()), observability::StringField("error", e.what())});
  }
  return info;
}

::grpc::Status ToStatus(const std::exception& e) {
  ::grpc::StatusCode code = ::grpc::StatusCode::INTERNAL;
  const auto         info = ToErrorInfo(e, &code);
  return {code, info.message(), info.SerializeAsString()};
}

} // namespace flotilla::grpc
