#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "flotilla/v1.hpp"
#include "internal/service/drone_bus_service.hpp"

namespace flotilla::grpc {

class DroneBusServer final : public flotilla::v1::DroneBusService::Service {
 public:
  explicit DroneBusServer(std::shared_ptr<flotilla::service::DroneBusService> svc);

  ::grpc::Status Register(::grpc::ServerContext*, const flotilla::v1::RegisterDroneRequest*, flotilla::v1::RegisterDroneResponse*) override;

  ::grpc::Status Heartbeat(::grpc::ServerContext*, const flotilla::v1::DroneRef*, google::protobuf::Empty*) override;

  ::grpc::Status Shutdown(::grpc::ServerContext*, const flotilla::v1::DroneRef*, google::protobuf::Empty*) override;

  ::grpc::Status ReportStatus(::grpc::ServerContext*, const flotilla::v1::StatusReport*, google::protobuf::Empty*) override;

  ::grpc::Status ReportKeepalive(::grpc::ServerContext*, const flotilla::v1::KeepaliveReport*, google::protobuf::Empty*) override;

  ::grpc::Status Attach(::grpc::ServerContext*, const flotilla::v1::DroneRef*, ::grpc::ServerWriter<flotilla::v1::DroneCommand>*) override;

 private:
  std::shared_ptr<flotilla::service::DroneBusService> service_;
};

} // namespace flotilla::grpc
