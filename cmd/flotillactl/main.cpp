#include <grpcpp/grpcpp.h>

#include <google/protobuf/util/time_util.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "client/cpp/flotilla_client.h"
#include "flotilla/v1.hpp"

using namespace flotilla::v1;
using flotilla::client::FlotillaClient;

static void Usage() {
  std::cout << "Usage:\n"
            << "  flotillactl <addr> connect [--cluster C] [--key NAME] [--tag TAG] [--image IMAGE] [--env K=V]...\n"
            << "                             [--lifetime SECONDS] [--max-idle SECONDS] [--retries N] [--wait]\n"
            << "  flotillactl <addr> terminate <backend_id> [--hard] [--wait]\n"
            << "  flotillactl <addr> drain <cluster> <drone>\n"
            << "  flotillactl <addr> release-key <cluster> <key>\n"
            << "  flotillactl <addr> events [--after ID | --from-latest]\n"
            << "  flotillactl <addr> list-drones [cluster] [--all]\n"
            << "  flotillactl <addr> list-backends [cluster] [--all]\n"
            << "  flotillactl <addr> termination-candidates [cluster] [drone]\n";
}

namespace {

// Splits argv past the command into flags and positional arguments.
struct Args {
  std::vector<std::string>                          positional;
  std::vector<std::pair<std::string, std::string>> flags;

  bool Has(const std::string& name) const {
    for (const auto& [k, _] : flags)
      if (k == name) return true;
    return false;
  }

  std::optional<std::string> Get(const std::string& name) const {
    for (const auto& [k, v] : flags)
      if (k == name) return v;
    return std::nullopt;
  }
};

bool TakesValue(const std::string& flag) {
  return flag != "--wait" && flag != "--hard" && flag != "--all" && flag != "--from-latest";
}

std::optional<Args> ParseArgs(int argc, char** argv, int first) {
  Args args;
  for (int i = first; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg.rfind("--", 0) != 0) {
      args.positional.push_back(arg);
      continue;
    }
    if (!TakesValue(arg)) {
      args.flags.emplace_back(arg, "");
      continue;
    }
    if (i + 1 >= argc) {
      std::cerr << "missing value for " << arg << "\n";
      return std::nullopt;
    }
    args.flags.emplace_back(arg, argv[++i]);
  }
  return args;
}

int Fail(const arrow::Status& status) {
  std::cerr << status.message() << "\n";
  if (auto detail = flotilla::client::ErrorDetail(status)) {
    std::cerr << "kind=" << ErrorKind_Name(detail->info().kind());
    if (!detail->info().existing_tag().empty()) std::cerr << " existing_tag=" << detail->info().existing_tag();
    if (!detail->info().error_id().empty()) std::cerr << " error_id=" << detail->info().error_id();
    std::cerr << "\n";
  }
  return 2;
}

std::string FormatTime(const google::protobuf::Timestamp& ts) {
  return google::protobuf::util::TimeUtil::ToString(ts);
}

int WaitFor(const FlotillaClient& client, const std::string& backend_id, BackendStatus status) {
  auto reached = client.WaitForStatus(backend_id, status);
  if (!reached.ok()) return Fail(reached.status());
  std::cout << "status=" << BackendStatus_Name(*reached) << "\n";
  return *reached == status ? 0 : 3;
}

int Connect(const FlotillaClient& client, const Args& args) {
  ConnectRequest req;
  req.set_cluster(args.Get("--cluster").value_or(""));

  if (auto key = args.Get("--key")) {
    req.mutable_key()->set_name(*key);
    req.mutable_key()->set_tag(args.Get("--tag").value_or(""));
  }

  if (auto image = args.Get("--image")) {
    auto* spawn = req.mutable_spawn_config();
    spawn->mutable_executable()->set_image(*image);
    for (const auto& [flag, value] : args.flags) {
      if (flag != "--env") continue;
      const auto eq = value.find('=');
      if (eq == std::string::npos) {
        std::cerr << "--env expects KEY=VALUE, got '" << value << "'\n";
        return 1;
      }
      (*spawn->mutable_executable()->mutable_env())[value.substr(0, eq)] = value.substr(eq + 1);
    }
    if (auto lifetime = args.Get("--lifetime")) spawn->set_lifetime_limit_seconds(static_cast<uint32_t>(std::stoul(*lifetime)));
    if (auto idle = args.Get("--max-idle")) spawn->set_max_idle_seconds(static_cast<uint32_t>(std::stoul(*idle)));
  }

  FlotillaClient::RetryPolicy retry;
  retry.max_retries = std::stoi(args.Get("--retries").value_or("0"));

  auto resp = client.Connect(req, retry);
  if (!resp.ok()) return Fail(resp.status());

  std::cout << "backend_id=" << resp->backend_id() << "\n";
  std::cout << "url=" << resp->url() << "\n";
  std::cout << "spawned=" << (resp->spawned() ? "true" : "false") << "\n";
  std::cout << "drone_id=" << resp->drone_id() << "\n";

  if (args.Has("--wait")) return WaitFor(client, resp->backend_id(), BACKEND_STATUS_READY);
  return 0;
}

int Terminate(const FlotillaClient& client, const Args& args) {
  if (args.positional.empty()) return 1;
  const auto& backend_id = args.positional[0];

  auto status = client.Terminate(backend_id, args.Has("--hard") ? TERMINATION_KIND_HARD : TERMINATION_KIND_SOFT);
  if (!status.ok()) return Fail(status);

  std::cout << "terminate requested\n";
  if (args.Has("--wait")) return WaitFor(client, backend_id, BACKEND_STATUS_TERMINATED);
  return 0;
}

int Events(const FlotillaClient& client, const Args& args) {
  WatchEventsRequest req;
  req.set_from_latest(args.Has("--from-latest"));
  if (auto after = args.Get("--after")) req.set_after_id(std::stoull(*after));

  ::grpc::ClientContext ctx;
  auto                reader = client.WatchEvents(req, &ctx);

  Event event;
  while (reader->Read(&event)) {
    std::cout << event.id() << " " << FormatTime(event.timestamp()) << " " << event.kind() << " " << (event.has_key() ? event.key() : "-") << " "
              << event.payload_json() << std::endl;
  }
  auto status = flotilla::client::FromGrpcStatus(reader->Finish(), "WatchEvents");
  if (!status.ok()) return Fail(status);
  return 0;
}

int ListDrones(const FlotillaClient& client, const Args& args) {
  ListDronesRequest req;
  if (!args.positional.empty()) req.set_cluster(args.positional[0]);
  req.set_include_terminated(args.Has("--all"));

  auto resp = client.ListDrones(req);
  if (!resp.ok()) return Fail(resp.status());

  for (const auto& drone : resp->drones()) {
    std::cout << drone.id() << " " << drone.cluster() << "/" << drone.name() << " " << DroneStatus_Name(drone.status())
              << " backends=" << drone.live_backends() << (drone.draining() ? " draining" : "")
              << " last_heartbeat=" << FormatTime(drone.last_heartbeat()) << "\n";
  }
  return 0;
}

int ListBackends(const FlotillaClient& client, const Args& args) {
  ListBackendsRequest req;
  if (!args.positional.empty()) req.set_cluster(args.positional[0]);
  req.set_include_terminated(args.Has("--all"));

  auto resp = client.ListBackends(req);
  if (!resp.ok()) return Fail(resp.status());

  for (const auto& backend : resp->backends()) {
    std::cout << backend.id() << " " << backend.cluster() << " drone=" << backend.drone_id() << " " << BackendStatus_Name(backend.status())
              << (backend.key().empty() ? "" : " key=" + backend.key()) << (backend.orphaned() ? " orphaned" : "") << "\n";
  }
  return 0;
}

int TerminationCandidates(const FlotillaClient& client, const Args& args) {
  TerminationCandidatesRequest req;
  if (args.positional.size() >= 1) req.set_cluster(args.positional[0]);
  if (args.positional.size() >= 2) req.set_drone(args.positional[1]);

  auto resp = client.TerminationCandidates(req);
  if (!resp.ok()) return Fail(resp.status());

  for (const auto& candidate : resp->candidates()) {
    std::cout << candidate.backend_id() << ":";
    if (candidate.expired()) {
      std::cout << " expired at " << FormatTime(candidate.expiration_time());
    }
    if (candidate.idle_overage_seconds() > 0) {
      std::cout << " idle " << candidate.idle_overage_seconds() << "s past the allowed " << candidate.allowed_idle_seconds()
                << "s (last keepalive " << FormatTime(candidate.last_keepalive()) << ")";
    }
    std::cout << "\n";
  }
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto args = ParseArgs(argc, argv, 3);
  if (!args) return 1;

  FlotillaClient client(::grpc::CreateChannel(addr, ::grpc::InsecureChannelCredentials()));

  try {
    if (cmd == "connect") return Connect(client, *args);
    if (cmd == "terminate") return Terminate(client, *args);
    if (cmd == "events") return Events(client, *args);
    if (cmd == "list-drones") return ListDrones(client, *args);
    if (cmd == "list-backends") return ListBackends(client, *args);
    if (cmd == "termination-candidates") return TerminationCandidates(client, *args);

    if (cmd == "drain") {
      if (args->positional.size() < 2) return 1;
      auto status = client.Drain(args->positional[0], args->positional[1]);
      if (!status.ok()) return Fail(status);
      std::cout << "draining\n";
      return 0;
    }

    if (cmd == "release-key") {
      if (args->positional.size() < 2) return 1;
      auto status = client.ReleaseKey(args->positional[0], args->positional[1]);
      if (!status.ok()) return Fail(status);
      std::cout << "released\n";
      return 0;
    }
  } catch (const std::logic_error& e) {
    // std::stoul and friends on malformed numbers
    std::cerr << "invalid argument: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
