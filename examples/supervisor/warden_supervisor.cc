/**
 * Runs the supervision core from a configuration file until SIGINT or
 * SIGTERM, printing status changes and server events as they happen.
 */

#include <getopt.h>
#include <signal.h>

#include <cstring>
#include <exception>
#include <string>

#include <fmt/format.h>

#include "warden/config/config_loader.h"
#include "warden/core/error.h"
#include "warden/orchestrator/service_orchestrator.h"

using namespace warden;

namespace {

constexpr const char* kUsage =
    "usage: {} -c <warden.yaml> [-v]\n"
    "\n"
    "Starts the configured tool servers and keeps them running.\n"
    "\n"
    "  -c, --config FILE   YAML or JSON configuration\n"
    "  -v, --verbose       log at debug level\n"
    "  -h, --help          print this text\n";

struct CommandLine {
  std::string config_path;
  bool verbose{false};
};

// Returns -1 to continue, otherwise the exit status
int parseCommandLine(int argc, char* argv[], CommandLine& cmd) {
  static const option long_options[] = {
      {"config", required_argument, nullptr, 'c'},
      {"verbose", no_argument, nullptr, 'v'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0}};

  int opt;
  while ((opt = getopt_long(argc, argv, "c:vh", long_options, nullptr)) !=
         -1) {
    switch (opt) {
      case 'c':
        cmd.config_path = optarg;
        break;
      case 'v':
        cmd.verbose = true;
        break;
      case 'h':
        fmt::print(kUsage, argv[0]);
        return 0;
      default:
        fmt::print(stderr, kUsage, argv[0]);
        return 2;
    }
  }
  if (optind < argc || cmd.config_path.empty()) {
    fmt::print(stderr, kUsage, argv[0]);
    return 2;
  }
  return -1;
}

void printEvents(orchestrator::ServiceOrchestrator& services) {
  services.statusChanges().subscribe(
      [](const orchestrator::ServiceStatus& status) {
        fmt::print("service {:<14} {}{}\n", status.name,
                   orchestrator::serviceStateToString(status.state),
                   status.message.empty() ? "" : " (" + status.message + ")");
      });
  services.serverEvents().subscribe([](const connection::ServerEvent& event) {
    std::string detail = event.message;
    if (event.type == connection::ServerEvent::Type::Connected) {
      detail = fmt::format("{} tools", event.tool_count);
    }
    fmt::print("server  {:<14} {}{}\n", event.server_id,
               connection::serverEventTypeToString(event.type),
               detail.empty() ? "" : ": " + detail);
  });
  services.processEvents().subscribe([](const process::ProcessEvent& event) {
    fmt::print("process {:<14} {}", event.process_id,
               process::processEventTypeToString(event.type));
    if (event.pid > 0) {
      fmt::print(" pid {}", event.pid);
    }
    fmt::print("\n");
  });
}

}  // namespace

int main(int argc, char* argv[]) {
  CommandLine cmd;
  int status = parseCommandLine(argc, argv, cmd);
  if (status >= 0) {
    return status;
  }

  config::WardenConfig cfg;
  try {
    cfg = config::loadConfigFile(cmd.config_path);
    if (cmd.verbose) {
      cfg.log_level = logging::LogLevel::Debug;
    }
    config::applyLogging(cfg);
  } catch (const config::ConfigParseError& e) {
    fmt::print(stderr, "{}\n", e.what());
    return 1;
  }

  // Block the stop signals before any thread starts so every thread
  // inherits the mask and only sigwait() below sees them
  sigset_t stop_signals;
  sigemptyset(&stop_signals);
  sigaddset(&stop_signals, SIGINT);
  sigaddset(&stop_signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);
  signal(SIGPIPE, SIG_IGN);

  auto& services = orchestrator::ServiceOrchestrator::instance();
  services.configure(config::toOrchestratorOptions(cfg));
  printEvents(services);

  try {
    services.initialize();
  } catch (const std::exception& e) {
    fmt::print(stderr, "startup failed: {}\n", e.what());
    return 1;
  }

  for (const auto& server : services.connectionManager().listConnected()) {
    fmt::print("ready   {:<14} {} tools\n", server.server_id,
               server.tools.size());
  }

  int received = 0;
  sigwait(&stop_signals, &received);
  fmt::print("{}, shutting down\n", strsignal(received));
  services.shutdown();
  return 0;
}
