#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "flotilla/v1.hpp"
#include "internal/service/controller_service.hpp"

namespace flotilla::grpc {

class ControllerServer final : public flotilla::v1::FleetControllerService::Service {
 public:
  explicit ControllerServer(std::shared_ptr<flotilla::service::ControllerService> svc);

  ::grpc::Status Connect(::grpc::ServerContext*, const flotilla::v1::ConnectRequest*, flotilla::v1::ConnectResponse*) override;

  ::grpc::Status Terminate(::grpc::ServerContext*, const flotilla::v1::TerminateRequest*, google::protobuf::Empty*) override;

  ::grpc::Status Drain(::grpc::ServerContext*, const flotilla::v1::DrainRequest*, google::protobuf::Empty*) override;

  ::grpc::Status ReleaseKey(::grpc::ServerContext*, const flotilla::v1::ReleaseKeyRequest*, google::protobuf::Empty*) override;

  ::grpc::Status WatchBackend(::grpc::ServerContext*, const flotilla::v1::WatchBackendRequest*,
                              ::grpc::ServerWriter<flotilla::v1::BackendStatusUpdate>*) override;

  ::grpc::Status WatchEvents(::grpc::ServerContext*, const flotilla::v1::WatchEventsRequest*, ::grpc::ServerWriter<flotilla::v1::Event>*) override;

  ::grpc::Status ListDrones(::grpc::ServerContext*, const flotilla::v1::ListDronesRequest*, flotilla::v1::ListDronesResponse*) override;

  ::grpc::Status ListBackends(::grpc::ServerContext*, const flotilla::v1::ListBackendsRequest*, flotilla::v1::ListBackendsResponse*) override;

  ::grpc::Status TerminationCandidates(::grpc::ServerContext*, const flotilla::v1::TerminationCandidatesRequest*,
                                       flotilla::v1::TerminationCandidatesResponse*) override;

 private:
  std::shared_ptr<flotilla::service::ControllerService> service_;
};

} // namespace flotilla::grpc
