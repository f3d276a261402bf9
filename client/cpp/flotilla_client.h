#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>
#include <grpcpp/support/sync_stream.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "flotilla/v1.hpp"

namespace flotilla::client {

/*
  Attached to every non-OK arrow::Status returned by FlotillaClient.
  Carries the gRPC code and the controller's ErrorInfo.
*/
class ControllerErrorDetail final : public arrow::StatusDetail {
 public:
  static constexpr const char* kTypeId = "flotilla::client::ControllerErrorDetail";

  ControllerErrorDetail(::grpc::StatusCode code, flotilla::v1::ErrorInfo info) : code_(code), info_(std::move(info)) {
  }

  const char* type_id() const override {
    return kTypeId;
  }

  std::string ToString() const override;

  ::grpc::StatusCode code() const {
    return code_;
  }

  const flotilla::v1::ErrorInfo& info() const {
    return info_;
  }

 private:
  ::grpc::StatusCode      code_;
  flotilla::v1::ErrorInfo info_;
};

// Detail of a failed call, or nullptr when the status did not come from the controller.
std::shared_ptr<ControllerErrorDetail> ErrorDetail(const arrow::Status& status);

// ErrorKind of a failed call; ERROR_KIND_UNSPECIFIED when unknown.
flotilla::v1::ErrorKind ErrorKindOf(const arrow::Status& status);

arrow::Status FromGrpcStatus(const ::grpc::Status& status, std::string_view action);

class FlotillaClient {
 public:
  struct RetryPolicy {
    // Extra attempts after a FailedToAcquireKey; 0 disables retrying.
    int                       max_retries = 0;
    std::chrono::milliseconds backoff{100};
  };

  explicit FlotillaClient(std::shared_ptr<::grpc::Channel> channel);

  arrow::Result<flotilla::v1::ConnectResponse> Connect(const flotilla::v1::ConnectRequest& request, const RetryPolicy& retry = {}) const;

  arrow::Status Terminate(const std::string& backend_id, flotilla::v1::TerminationKind kind = flotilla::v1::TERMINATION_KIND_SOFT) const;

  arrow::Status Drain(const std::string& cluster, const std::string& drone) const;

  arrow::Status ReleaseKey(const std::string& cluster, const std::string& key) const;

  arrow::Result<flotilla::v1::ListDronesResponse> ListDrones(const flotilla::v1::ListDronesRequest& request) const;

  arrow::Result<flotilla::v1::ListBackendsResponse> ListBackends(const flotilla::v1::ListBackendsRequest& request) const;

  arrow::Result<flotilla::v1::TerminationCandidatesResponse> TerminationCandidates(
      const flotilla::v1::TerminationCandidatesRequest& request) const;

  /*
    Streams status updates for one backend to `on_update` until the backend
    reaches Terminated, `on_update` returns false, or the stream fails.
    Cancel through `context` from another thread.
  */
  arrow::Status WatchBackend(const std::string& backend_id, const std::function<bool(const flotilla::v1::BackendStatusUpdate&)>& on_update,
                             ::grpc::ClientContext* context) const;

  // Blocks until the backend reports at least `status` (or passes it).
  // A backend that starts terminating before a running status it was
  // waited for is an error.
  arrow::Result<flotilla::v1::BackendStatus> WaitForStatus(const std::string& backend_id, flotilla::v1::BackendStatus status) const;

  std::unique_ptr<::grpc::ClientReader<flotilla::v1::Event>> WatchEvents(const flotilla::v1::WatchEventsRequest& request,
                                                                       ::grpc::ClientContext*                     context) const;

 private:
  std::unique_ptr<flotilla::v1::FleetControllerService::Stub> stub_;
};

} // namespace flotilla::client
