#include "client/cpp/flotilla_client.h"

#include <grpcpp/client_context.h>

#include <string>
#include <string_view>
#include <thread>

namespace flotilla::client {

namespace {

arrow::StatusCode ArrowCodeFor(::grpc::StatusCode code) {
  switch (code) {
    case ::grpc::StatusCode::INVALID_ARGUMENT:
    case ::grpc::StatusCode::FAILED_PRECONDITION:
      return arrow::StatusCode::Invalid;
    case ::grpc::StatusCode::NOT_FOUND:
      return arrow::StatusCode::KeyError;
    case ::grpc::StatusCode::ALREADY_EXISTS:
      return arrow::StatusCode::AlreadyExists;
    case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
      return arrow::StatusCode::CapacityError;
    case ::grpc::StatusCode::CANCELLED:
      return arrow::StatusCode::Cancelled;
    default:
      return arrow::StatusCode::IOError;
  }
}

bool IsAcquireConflict(const arrow::Status& status) {
  return ErrorKindOf(status) == flotilla::v1::ERROR_KIND_FAILED_TO_ACQUIRE_KEY;
}

} // namespace

std::string ControllerErrorDetail::ToString() const {
  std::string out = flotilla::v1::ErrorKind_Name(info_.kind());
  if (!info_.existing_tag().empty()) out += " existing_tag=" + info_.existing_tag();
  if (!info_.error_id().empty()) out += " error_id=" + info_.error_id();
  return out;
}

std::shared_ptr<ControllerErrorDetail> ErrorDetail(const arrow::Status& status) {
  const auto& detail = status.detail();
  if (!detail || std::string_view(detail->type_id()) != ControllerErrorDetail::kTypeId) {
    return nullptr;
  }
  return std::static_pointer_cast<ControllerErrorDetail>(detail);
}

flotilla::v1::ErrorKind ErrorKindOf(const arrow::Status& status) {
  auto detail = ErrorDetail(status);
  return detail ? detail->info().kind() : flotilla::v1::ERROR_KIND_UNSPECIFIED;
}

arrow::Status FromGrpcStatus(const ::grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }

  flotilla::v1::ErrorInfo info;
  if (status.error_details().empty() || !info.ParseFromString(status.error_details())) {
    info.set_kind(flotilla::v1::ERROR_KIND_OTHER);
    info.set_message(status.error_message());
  }

  return arrow::Status(ArrowCodeFor(status.error_code()), std::string(action) + " failed: " + status.error_message(),
                       std::make_shared<ControllerErrorDetail>(status.error_code(), std::move(info)));
}

FlotillaClient::FlotillaClient(std::shared_ptr<::grpc::Channel> channel) : stub_(flotilla::v1::FleetControllerService::NewStub(channel)) {
}

arrow::Result<flotilla::v1::ConnectResponse> FlotillaClient::Connect(const flotilla::v1::ConnectRequest& request, const RetryPolicy& retry) const {
  for (int attempt = 0;; ++attempt) {
    ::grpc::ClientContext         ctx;
    flotilla::v1::ConnectResponse resp;
    auto status = FromGrpcStatus(stub_->Connect(&ctx, request, &resp), "Connect");
    if (status.ok()) {
      return resp;
    }
    if (attempt >= retry.max_retries || !IsAcquireConflict(status)) {
      return status;
    }
    std::this_thread::sleep_for(retry.backoff * (attempt + 1));
  }
}

arrow::Status FlotillaClient::Terminate(const std::string& backend_id, flotilla::v1::TerminationKind kind) const {
  flotilla::v1::TerminateRequest req;
  req.set_backend_id(backend_id);
  req.set_kind(kind);

  ::grpc::ClientContext   ctx;
  google::protobuf::Empty resp;
  return FromGrpcStatus(stub_->Terminate(&ctx, req, &resp), "Terminate");
}

arrow::Status FlotillaClient::Drain(const std::string& cluster, const std::string& drone) const {
  flotilla::v1::DrainRequest req;
  req.set_cluster(cluster);
  req.set_drone(drone);

  ::grpc::ClientContext   ctx;
  google::protobuf::Empty resp;
  return FromGrpcStatus(stub_->Drain(&ctx, req, &resp), "Drain");
}

arrow::Status FlotillaClient::ReleaseKey(const std::string& cluster, const std::string& key) const {
  flotilla::v1::ReleaseKeyRequest req;
  req.set_cluster(cluster);
  req.set_key(key);

  ::grpc::ClientContext   ctx;
  google::protobuf::Empty resp;
  return FromGrpcStatus(stub_->ReleaseKey(&ctx, req, &resp), "ReleaseKey");
}

arrow::Result<flotilla::v1::ListDronesResponse> FlotillaClient::ListDrones(const flotilla::v1::ListDronesRequest& request) const {
  ::grpc::ClientContext            ctx;
  flotilla::v1::ListDronesResponse resp;
  ARROW_RETURN_NOT_OK(FromGrpcStatus(stub_->ListDrones(&ctx, request, &resp), "ListDrones"));
  return resp;
}

arrow::Result<flotilla::v1::ListBackendsResponse> FlotillaClient::ListBackends(const flotilla::v1::ListBackendsRequest& request) const {
  ::grpc::ClientContext              ctx;
  flotilla::v1::ListBackendsResponse resp;
  ARROW_RETURN_NOT_OK(FromGrpcStatus(stub_->ListBackends(&ctx, request, &resp), "ListBackends"));
  return resp;
}

arrow::Result<flotilla::v1::TerminationCandidatesResponse> FlotillaClient::TerminationCandidates(
    const flotilla::v1::TerminationCandidatesRequest& request) const {
  ::grpc::ClientContext                       ctx;
  flotilla::v1::TerminationCandidatesResponse resp;
  ARROW_RETURN_NOT_OK(FromGrpcStatus(stub_->TerminationCandidates(&ctx, request, &resp), "TerminationCandidates"));
  return resp;
}

arrow::Status FlotillaClient::WatchBackend(const std::string& backend_id,
                                           const std::function<bool(const flotilla::v1::BackendStatusUpdate&)>& on_update,
                                           ::grpc::ClientContext* context) const {
  flotilla::v1::WatchBackendRequest req;
  req.set_backend_id(backend_id);

  auto reader = stub_->WatchBackend(context, req);

  flotilla::v1::BackendStatusUpdate update;
  while (reader->Read(&update)) {
    if (!on_update(update)) {
      context->TryCancel();
      break;
    }
  }

  const auto status = reader->Finish();
  if (status.error_code() == ::grpc::StatusCode::CANCELLED) {
    return arrow::Status::OK();
  }
  return FromGrpcStatus(status, "WatchBackend");
}

arrow::Result<flotilla::v1::BackendStatus> FlotillaClient::WaitForStatus(const std::string& backend_id, flotilla::v1::BackendStatus status) const {
  ::grpc::ClientContext       ctx;
  flotilla::v1::BackendStatus reached = flotilla::v1::BACKEND_STATUS_UNSPECIFIED;

  ARROW_RETURN_NOT_OK(WatchBackend(
      backend_id,
      [&](const flotilla::v1::BackendStatusUpdate& update) {
        reached = update.status();
        return static_cast<int>(reached) < static_cast<int>(status);
      },
      &ctx));

  if (static_cast<int>(reached) < static_cast<int>(status)) {
    return arrow::Status::Invalid("backend ", backend_id, " stream ended at ", flotilla::v1::BackendStatus_Name(reached));
  }

  // went into termination without ever being at the requested status
  const int stopping = static_cast<int>(flotilla::v1::BACKEND_STATUS_TERMINATING);
  if (reached != status && static_cast<int>(reached) >= stopping && static_cast<int>(status) < stopping) {
    return arrow::Status::Invalid("backend ", backend_id, " stopped at ", flotilla::v1::BackendStatus_Name(reached), " before reaching ",
                                  flotilla::v1::BackendStatus_Name(status));
  }
  return reached;
}

std::unique_ptr<::grpc::ClientReader<flotilla::v1::Event>> FlotillaClient::WatchEvents(const flotilla::v1::WatchEventsRequest& request,
                                                                                       ::grpc::ClientContext*                   context) const {
  return stub_->WatchEvents(context, request);
}

} // namespace flotilla::client
