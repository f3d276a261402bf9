#include "drone_bus_server.hpp"

#include "grpc_error.hpp"

namespace flotilla::grpc {

DroneBusServer::DroneBusServer(std::shared_ptr<flotilla::service::DroneBusService> svc) : service_(std::move(svc)) {
}

::grpc::Status DroneBusServer::Register(::grpc::ServerContext*, const flotilla::v1::RegisterDroneRequest* req,
                                        flotilla::v1::RegisterDroneResponse* resp) {
  try {
    *resp = service_->Register(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DroneBusServer::Heartbeat(::grpc::ServerContext*, const flotilla::v1::DroneRef* req, google::protobuf::Empty*) {
  try {
    service_->Heartbeat(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DroneBusServer::Shutdown(::grpc::ServerContext*, const flotilla::v1::DroneRef* req, google::protobuf::Empty*) {
  try {
    service_->Shutdown(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DroneBusServer::ReportStatus(::grpc::ServerContext*, const flotilla::v1::StatusReport* req, google::protobuf::Empty*) {
  try {
    service_->ReportStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DroneBusServer::ReportKeepalive(::grpc::ServerContext*, const flotilla::v1::KeepaliveReport* req, google::protobuf::Empty*) {
  try {
    service_->ReportKeepalive(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DroneBusServer::Attach(::grpc::ServerContext* ctx, const flotilla::v1::DroneRef* req,
                                      ::grpc::ServerWriter<flotilla::v1::DroneCommand>* writer) {
  try {
    service_->Attach(
        *req, [writer](const flotilla::v1::DroneCommand& command) { return writer->Write(command); }, [ctx] { return ctx->IsCancelled(); });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace flotilla::grpc
