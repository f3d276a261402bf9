#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace flotilla::runtime {

// Hosts the controller's gRPC services on one listening address.
class Server {
 public:
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  // Throws std::runtime_error when the address can not be bound.
  void Start();

  // Port actually bound; differs from the address when it asks for port 0.
  int Port() const {
    return port_;
  }

  // Drone streams still open at the deadline are cancelled.
  void Stop(std::chrono::milliseconds grace = std::chrono::seconds(2));

 private:
  std::string                                   bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               server_;
  int                                           port_ = 0;
};

} // namespace flotilla::runtime
