#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

#include "flotilla/v1.hpp"

namespace flotilla::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  Every status carries a serialized ErrorInfo in its details. Errors
  without a dedicated mapping are reported as INTERNAL with a generic
  message and an error id; the original message is only logged.
*/

::grpc::Status ToStatus(const std::exception& e);

flotilla::v1::ErrorInfo ToErrorInfo(const std::exception& e, ::grpc::StatusCode* code);

} // namespace flotilla::grpc
