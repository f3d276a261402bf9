#pragma once

#include <chrono>
#include <functional>

#include "flotilla/v1.hpp"
#include "service_context.hpp"

namespace flotilla::service {

// Returns false once the receiving side is gone.
template <typename T>
using StreamSink = std::function<bool(const T&)>;

using CancelCheck = std::function<bool()>;

class ControllerService {
 public:
  // Upper bound on how long a stream waits before re-checking cancellation.
  static constexpr std::chrono::milliseconds kStreamPollInterval{500};

  explicit ControllerService(ServiceContext ctx);

  flotilla::v1::ConnectResponse Connect(const flotilla::v1::ConnectRequest& req);

  void Terminate(const flotilla::v1::TerminateRequest& req);
  void Drain(const flotilla::v1::DrainRequest& req);
  void ReleaseKey(const flotilla::v1::ReleaseKeyRequest& req);

  flotilla::v1::ListDronesResponse   ListDrones(const flotilla::v1::ListDronesRequest& req);
  flotilla::v1::ListBackendsResponse ListBackends(const flotilla::v1::ListBackendsRequest& req);

  flotilla::v1::TerminationCandidatesResponse TerminationCandidates(const flotilla::v1::TerminationCandidatesRequest& req);

  /*
    Sends the backend's current status, then every later status change.
    Returns after Terminated was sent, when the sink fails, or when
    `cancelled` turns true.
  */
  void WatchBackend(const flotilla::v1::WatchBackendRequest& req, const StreamSink<flotilla::v1::BackendStatusUpdate>& sink,
                    const CancelCheck& cancelled);

  void WatchEvents(const flotilla::v1::WatchEventsRequest& req, const StreamSink<flotilla::v1::Event>& sink, const CancelCheck& cancelled);

 private:
  ServiceContext ctx_;
};

} // namespace flotilla::service
