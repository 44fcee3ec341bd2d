#ifndef WARDEN_ORCHESTRATOR_SERVICE_ORCHESTRATOR_H
#define WARDEN_ORCHESTRATOR_SERVICE_ORCHESTRATOR_H

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "warden/connection/server_config.h"
#include "warden/connection/server_connection_manager.h"
#include "warden/connection/tool_protocol.h"
#include "warden/core/compat.h"
#include "warden/core/event_channel.h"
#include "warden/orchestrator/service_phase.h"
#include "warden/process/process_pool.h"

namespace warden {
namespace orchestrator {

enum class ServiceState { Initializing, Ready, Error, Stopping };

const char* serviceStateToString(ServiceState state);

struct ServiceStatus {
  std::string name;
  ServiceState state{ServiceState::Initializing};
  std::string message;
  std::chrono::system_clock::time_point timestamp;
};

struct LifecycleEvent {
  enum class Type { Initialized, ShutdownComplete };

  Type type{Type::Initialized};
  std::chrono::system_clock::time_point timestamp;
};

using ProtocolFactory =
    std::function<connection::ToolProtocolPtr(process::ProcessPool&)>;

struct OrchestratorOptions {
  // Root of the directories created by the infrastructure phase
  std::string data_root{"."};
  std::vector<std::string> directories{"logs", "cache", "workspace", "temp"};
  process::PoolOptions pool;
  connection::ConnectionManagerOptions connections;
  // Servers connected by the mcp phase; disabled ones are skipped
  std::vector<connection::ServerConfig> servers;
  DatabasePtr database;
  // Defaults to StdioToolProtocol
  ProtocolFactory protocol_factory;
  // Run the infrastructure, process-pool and mcp phases before any phase
  // added with addPhase()
  bool install_default_phases{true};
};

/**
 * @brief Starts and stops the supervision core in a fixed phase order
 *
 * Concurrent initialize() calls collapse into a single startup run whose
 * outcome every caller observes. shutdown() stops phases in reverse order
 * and keeps going when one of them fails.
 */
class ServiceOrchestrator {
 public:
  // Process-wide instance, created on first use
  static ServiceOrchestrator& instance();

  explicit ServiceOrchestrator(
      OrchestratorOptions options = OrchestratorOptions());
  ~ServiceOrchestrator();

  ServiceOrchestrator(const ServiceOrchestrator&) = delete;
  ServiceOrchestrator& operator=(const ServiceOrchestrator&) = delete;

  /**
   * Replace the options used by the next initialize().
   * @throws WardenError(ConfigInvalid) while initialized or initializing
   */
  void configure(OrchestratorOptions options);

  // Append a phase run after the built-in ones
  void addPhase(ServicePhasePtr phase);

  /**
   * Run every phase in order. Returns immediately when already
   * initialized. On failure the phases already started are stopped and the
   * original exception is rethrown.
   */
  void initialize();

  void shutdown();

  bool isInitialized() const;

  optional<ServiceStatus> getStatus(const std::string& name) const;
  std::map<std::string, ServiceStatus> getAllStatuses() const;

  // All accessors throw NotInitializedError before initialize() succeeds
  process::ProcessPool& processPool();
  connection::ServerConnectionManager& connectionManager();
  Database& database();

  EventChannel<ServiceStatus>& statusChanges() { return status_changes_; }
  EventChannel<LifecycleEvent>& lifecycle() { return lifecycle_; }
  EventChannel<process::ProcessEvent>& processEvents() {
    return process_events_;
  }
  EventChannel<connection::ServerEvent>& serverEvents() {
    return server_events_;
  }

 private:
  std::vector<ServicePhasePtr> buildPhases(const OrchestratorOptions& options);
  void runPhases(const std::vector<ServicePhasePtr>& phases);
  void stopPhases(const std::vector<ServicePhasePtr>& phases);

  void startInfrastructure(const OrchestratorOptions& options);
  void stopInfrastructure();
  void startProcessPool(const OrchestratorOptions& options);
  void stopProcessPool();
  void startConnections(const OrchestratorOptions& options);
  void stopConnections();

  void setStatus(const std::string& name,
                 ServiceState state,
                 const std::string& message);
  void clearStatus(const std::string& name);
  void emitLifecycle(LifecycleEvent::Type type);

  mutable std::mutex mutex_;
  OrchestratorOptions options_;
  std::vector<ServicePhasePtr> extra_phases_;
  std::vector<ServicePhasePtr> started_phases_;
  bool initialized_{false};
  bool initializing_{false};
  std::shared_future<void> init_future_;
  std::atomic<bool> shutting_down_{false};

  std::unique_ptr<process::ProcessPool> pool_;
  connection::ToolProtocolPtr protocol_;
  std::unique_ptr<connection::ServerConnectionManager> manager_;
  DatabasePtr database_;
  uint64_t pool_subscription_{0};
  uint64_t server_subscription_{0};

  mutable std::mutex status_mutex_;
  std::map<std::string, ServiceStatus> statuses_;

  EventChannel<ServiceStatus> status_changes_;
  EventChannel<LifecycleEvent> lifecycle_;
  EventChannel<process::ProcessEvent> process_events_;
  EventChannel<connection::ServerEvent> server_events_;
};

}  // namespace orchestrator
}  // namespace warden

#endif  // WARDEN_ORCHESTRATOR_SERVICE_ORCHESTRATOR_H
