#include <signal.h>

#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

namespace {

namespace obs = flotilla::observability;

struct Options {
  std::string config_path;
  bool        check_only = false;
};

constexpr const char* kUsage =
    "usage: flotilla-controller [--check] <config.yaml>\n"
    "       flotilla-controller [--check] --config <config.yaml>\n"
    "  --check  validate the configuration and exit\n";

std::optional<Options> ParseArgs(int argc, char** argv) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check") {
      options.check_only = true;
    } else if (arg == "--config" && i + 1 < argc) {
      options.config_path = argv[++i];
    } else if (!arg.empty() && arg[0] != '-' && options.config_path.empty()) {
      options.config_path = arg;
    } else {
      return std::nullopt;
    }
  }
  if (options.config_path.empty()) return std::nullopt;
  return options;
}

// Blocked before any thread starts so every thread inherits the mask and
// only WaitForTermination() sees SIGINT and SIGTERM.
sigset_t BlockTerminationSignals() {
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);
  return signals;
}

int WaitForTermination(const sigset_t& signals) {
  int signal_number = 0;
  while (sigwait(&signals, &signal_number) != 0) {
  }
  return signal_number;
}

void ShutdownObservability() {
  obs::ShutdownMetrics();
  obs::ShutdownTracing();
  obs::ShutdownLogging();
}

int Run(const flotilla::runtime::config::RuntimeConfig& config) {
  const auto signals = BlockTerminationSignals();

  obs::InitializeLogging(config);
  obs::InitializeTracing(config);
  obs::InitializeMetrics(config);

  auto                      app = flotilla::factory::Build(config);
  flotilla::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));
  server.Start();
  app.Start();

  FLOTILLA_LOG_INFO("flotilla controller started", {obs::IntField("port", server.Port()), obs::StringField("controller_id", config.controller().id()),
                                                     obs::StringField("default_cluster", config.controller().default_cluster())});

  const int signal_number = WaitForTermination(signals);
  FLOTILLA_LOG_INFO("shutting down flotilla controller", {obs::IntField("signal", signal_number)});

  // ends the drone streams so the server drains before its deadline
  app.Stop();
  server.Stop();
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  const auto options = ParseArgs(argc, argv);
  if (!options) {
    std::cerr << kUsage;
    return 1;
  }

  flotilla::runtime::config::RuntimeConfig config;
  try {
    config = flotilla::config::ConfigLoader::LoadFromYaml(options->config_path);
  } catch (const std::exception& e) {
    std::cerr << "invalid configuration " << options->config_path << ": " << e.what() << std::endl;
    return 1;
  }
  if (options->check_only) {
    std::cout << options->config_path << ": ok" << std::endl;
    return 0;
  }

  int exit_code = 0;
  try {
    exit_code = Run(config);
  } catch (const std::exception& e) {
    FLOTILLA_LOG_ERROR("fatal error", {obs::StringField("error", e.what())});
    exit_code = 2;
  }
  ShutdownObservability();
  return exit_code;
}
