#pragma once

#include <stdexcept>
#include <string>

namespace flotilla::util {

/*
  Central error types.

  These get translated later to gRPC status codes (internal/grpc/grpc_error).
  Anything not listed here is reported to callers as an opaque internal error.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ---------------------------------------------------------------------
// Connect / key lock protocol
// ---------------------------------------------------------------------

class ConnectError : public std::runtime_error {
 public:
  explicit ConnectError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NoClusterProvided : public ConnectError {
 public:
  NoClusterProvided() : ConnectError("No cluster provided, and no default cluster for this controller.") {
  }
};

class KeyUnheldNoSpawnConfig : public ConnectError {
 public:
  explicit KeyUnheldNoSpawnConfig(const std::string& key)
      : ConnectError(key.empty() ? "No key and no spawn config were provided." : "Lock '" + key + "' is unheld but no spawn config was provided.") {
  }
};

class KeyHeld : public ConnectError {
 public:
  KeyHeld(const std::string& key, std::string existing_tag)
      : ConnectError("Lock '" + key + "' is held but tag does not match (held with tag '" + existing_tag + "')."),
        existing_tag_(std::move(existing_tag)) {
  }

  const std::string& existing_tag() const {
    return existing_tag_;
  }

 private:
  std::string existing_tag_;
};

class KeyHeldUnhealthy : public ConnectError {
 public:
  explicit KeyHeldUnhealthy(const std::string& key) : ConnectError("Lock '" + key + "' is held but unhealthy.") {
  }
};

class NoDroneAvailable : public ConnectError {
 public:
  explicit NoDroneAvailable(const std::string& cluster) : ConnectError("No active drone available in cluster '" + cluster + "'.") {
  }
};

// The store failure behind these two is logged where it is caught and
// never carried in the message.
class FailedToAcquireKey : public ConnectError {
 public:
  FailedToAcquireKey() : ConnectError("Failed to acquire lock.") {
  }
};

class FailedToRemoveKey : public ConnectError {
 public:
  FailedToRemoveKey() : ConnectError("Failed to remove lock.") {
  }
};

} // namespace flotilla::util
