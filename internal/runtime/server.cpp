#include "server.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace flotilla::runtime {

namespace {

// Drone Attach streams stay open for the life of the drone; pings detect a
// drone that vanished without closing its stream.
constexpr int kKeepaliveTimeMs    = 30000;
constexpr int kKeepaliveTimeoutMs = 10000;

} // namespace

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &port_);
  builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_TIME_MS, kKeepaliveTimeMs);
  builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, kKeepaliveTimeoutMs);
  builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, 1);
  for (const auto& service : services_) {
    builder.RegisterService(service.get());
  }

  server_ = builder.BuildAndStart();
  if (!server_ || port_ == 0) {
    server_.reset();
    throw std::runtime_error("could not listen on " + bind_address_);
  }

  FLOTILLA_LOG_INFO("gRPC server listening", {observability::StringField("bind_address", bind_address_), observability::IntField("port", port_),
                                              observability::UintField("services", services_.size())});
}

void Server::Stop(std::chrono::milliseconds grace) {
  if (!server_) return;

  server_->Shutdown(std::chrono::system_clock::now() + grace);
  server_.reset();
  FLOTILLA_LOG_INFO("gRPC server stopped", {observability::StringField("bind_address", bind_address_)});
}

} // namespace flotilla::runtime
