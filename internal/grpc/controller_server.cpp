#include "controller_server.hpp"

#include "grpc_error.hpp"

namespace flotilla::grpc {

ControllerServer::ControllerServer(std::shared_ptr<flotilla::service::ControllerService> svc) : service_(std::move(svc)) {
}

::grpc::Status ControllerServer::Connect(::grpc::ServerContext*, const flotilla::v1::ConnectRequest* req, flotilla::v1::ConnectResponse* resp) {
  try {
    *resp = service_->Connect(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControllerServer::Terminate(::grpc::ServerContext*, const flotilla::v1::TerminateRequest* req, google::protobuf::Empty*) {
  try {
    service_->Terminate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControllerServer::Drain(::grpc::ServerContext*, const flotilla::v1::DrainRequest* req, google::protobuf::Empty*) {
  try {
    service_->Drain(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControllerServer::ReleaseKey(::grpc::ServerContext*, const flotilla::v1::ReleaseKeyRequest* req, google::protobuf::Empty*) {
  try {
    service_->ReleaseKey(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControllerServer::WatchBackend(::grpc::ServerContext* ctx, const flotilla::v1::WatchBackendRequest* req,
                                              ::grpc::ServerWriter<flotilla::v1::BackendStatusUpdate>* writer) {
  try {
    service_->WatchBackend(
        *req, [writer](const flotilla::v1::BackendStatusUpdate& update) { return writer->Write(update); },
        [ctx] { return ctx->IsCancelled(); });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControllerServer::WatchEvents(::grpc::ServerContext* ctx, const flotilla::v1::WatchEventsRequest* req,
                                             ::grpc::ServerWriter<flotilla::v1::Event>* writer) {
  try {
    service_->WatchEvents(
        *req, [writer](const flotilla::v1::Event& event) { return writer->Write(event); }, [ctx] { return ctx->IsCancelled(); });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControllerServer::ListDrones(::grpc::ServerContext*, const flotilla::v1::ListDronesRequest* req,
                                            flotilla::v1::ListDronesResponse* resp) {
  try {
    *resp = service_->ListDrones(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControllerServer::ListBackends(::grpc::ServerContext*, const flotilla::v1::ListBackendsRequest* req,
                                              flotilla::v1::ListBackendsResponse* resp) {
  try {
    *resp = service_->ListBackends(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControllerServer::TerminationCandidates(::grpc::ServerContext*, const flotilla::v1::TerminationCandidatesRequest* req,
                                                       flotilla::v1::TerminationCandidatesResponse* resp) {
  try {
    *resp = service_->TerminationCandidates(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace flotilla::grpc
