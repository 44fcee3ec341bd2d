#define WARDEN_LOG_COMPONENT "orchestrator"

#include "warden/orchestrator/service_orchestrator.h"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <utility>

#include <fmt/format.h>

#include "warden/connection/stdio_tool_protocol.h"
#include "warden/core/error.h"
#include "warden/logging/log_macros.h"

namespace warden {
namespace orchestrator {

const char* serviceStateToString(ServiceState state) {
  switch (state) {
    case ServiceState::Initializing:
      return "initializing";
    case ServiceState::Ready:
      return "ready";
    case ServiceState::Error:
      return "error";
    case ServiceState::Stopping:
      return "stopping";
  }
  return "unknown";
}

ServiceOrchestrator& ServiceOrchestrator::instance() {
  static ServiceOrchestrator orchestrator;
  return orchestrator;
}

ServiceOrchestrator::ServiceOrchestrator(OrchestratorOptions options)
    : options_(std::move(options)) {
  // Constructed first so it is destroyed after us and shutdown can log
  logging::LoggerRegistry::instance();
}

ServiceOrchestrator::~ServiceOrchestrator() { shutdown(); }

void ServiceOrchestrator::configure(OrchestratorOptions options) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (initialized_ || initializing_) {
    throw WardenError(errors::ConfigInvalid,
                      "cannot reconfigure a running orchestrator");
  }
  options_ = std::move(options);
}

void ServiceOrchestrator::addPhase(ServicePhasePtr phase) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (initialized_ || initializing_) {
    throw WardenError(errors::ConfigInvalid,
                      "cannot add phase " + phase->name() +
                          " to a running orchestrator");
  }
  extra_phases_.push_back(std::move(phase));
}

void ServiceOrchestrator::initialize() {
  std::shared_ptr<std::promise<void>> promise;
  std::shared_future<void> in_flight;
  OrchestratorOptions options;
  std::vector<ServicePhasePtr> extra;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
      return;
    }
    if (initializing_) {
      in_flight = init_future_;
    } else {
      initializing_ = true;
      promise = std::make_shared<std::promise<void>>();
      init_future_ = promise->get_future().share();
      options = options_;
      extra = extra_phases_;
    }
  }

  if (!promise) {
    // Another caller is running startup; share its outcome
    WARDEN_LOG(Debug, "waiting for in-flight initialization");
    in_flight.get();
    return;
  }

  WARDEN_LOG(Info, "initializing services");
  std::vector<ServicePhasePtr> phases = buildPhases(options);
  phases.insert(phases.end(), extra.begin(), extra.end());

  try {
    runPhases(phases);
  } catch (...) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      initializing_ = false;
    }
    promise->set_exception(std::current_exception());
    throw;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    initialized_ = true;
    initializing_ = false;
  }
  WARDEN_LOG(Info, "services initialized ({} phases)", phases.size());
  emitLifecycle(LifecycleEvent::Type::Initialized);
  promise->set_value();
}

void ServiceOrchestrator::shutdown() {
  if (shutting_down_.exchange(true)) {
    return;
  }

  std::shared_future<void> in_flight;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initializing_) {
      in_flight = init_future_;
    }
  }
  if (in_flight.valid()) {
    in_flight.wait();
  }

  std::vector<ServicePhasePtr> phases;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      shutting_down_ = false;
      return;
    }
    // Accessors fail from here on
    initialized_ = false;
    phases.swap(started_phases_);
  }

  WARDEN_LOG(Info, "shutting down {} phases", phases.size());
  stopPhases(phases);
  emitLifecycle(LifecycleEvent::Type::ShutdownComplete);
  WARDEN_LOG(Info, "shutdown complete");

  shutting_down_ = false;
}

bool ServiceOrchestrator::isInitialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return initialized_;
}

optional<ServiceStatus> ServiceOrchestrator::getStatus(
    const std::string& name) const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  auto it = statuses_.find(name);
  if (it == statuses_.end()) {
    return nullopt;
  }
  return it->second;
}

std::map<std::string, ServiceStatus> ServiceOrchestrator::getAllStatuses()
    const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return statuses_;
}

process::ProcessPool& ServiceOrchestrator::processPool() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!initialized_ || !pool_) {
    throw NotInitializedError("process pool");
  }
  return *pool_;
}

connection::ServerConnectionManager& ServiceOrchestrator::connectionManager() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!initialized_ || !manager_) {
    throw NotInitializedError("connection manager");
  }
  return *manager_;
}

Database& ServiceOrchestrator::database() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!initialized_) {
    throw NotInitializedError("database");
  }
  if (!database_) {
    throw WardenError(errors::ConfigInvalid, "no database configured");
  }
  return *database_;
}

std::vector<ServicePhasePtr> ServiceOrchestrator::buildPhases(
    const OrchestratorOptions& options) {
  std::vector<ServicePhasePtr> phases;
  if (!options.install_default_phases) {
    return phases;
  }

  phases.push_back(std::make_shared<FunctionPhase>(
      "infrastructure", [this, options]() { startInfrastructure(options); },
      [this]() { stopInfrastructure(); }));
  phases.push_back(std::make_shared<FunctionPhase>(
      "process-pool", [this, options]() { startProcessPool(options); },
      [this]() { stopProcessPool(); }));
  phases.push_back(std::make_shared<FunctionPhase>(
      "mcp", [this, options]() { startConnections(options); },
      [this]() { stopConnections(); }));
  return phases;
}

void ServiceOrchestrator::runPhases(
    const std::vector<ServicePhasePtr>& phases) {
  std::vector<ServicePhasePtr> started;

  for (const auto& phase : phases) {
    const std::string& name = phase->name();
    setStatus(name, ServiceState::Initializing, "starting");
    WARDEN_LOG(Info, "starting phase {}", name);

    try {
      phase->start();
    } catch (const std::exception& e) {
      WARDEN_LOG(Error, "phase {} failed: {}", name, e.what());
      setStatus(name, ServiceState::Error, e.what());
      // Undo what already came up, then report the original failure
      stopPhases(started);
      throw;
    }

    started.push_back(phase);
    setStatus(name, ServiceState::Ready, "ready");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  started_phases_ = std::move(started);
}

void ServiceOrchestrator::stopPhases(
    const std::vector<ServicePhasePtr>& phases) {
  for (auto it = phases.rbegin(); it != phases.rend(); ++it) {
    const std::string& name = (*it)->name();
    setStatus(name, ServiceState::Stopping, "stopping");
    WARDEN_LOG(Info, "stopping phase {}", name);
    try {
      (*it)->stop();
    } catch (const std::exception& e) {
      WARDEN_LOG(Error, "phase {} failed to stop: {}", name, e.what());
    }
    clearStatus(name);
  }
}

void ServiceOrchestrator::startInfrastructure(
    const OrchestratorOptions& options) {
  namespace fs = std::filesystem;

  fs::path root(options.data_root);
  for (const auto& dir : options.directories) {
    fs::path path = root / dir;
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
      throw WardenError(errors::ConfigInvalid,
                        fmt::format("cannot create directory {}: {}",
                                    path.string(), ec.message()));
    }
    WARDEN_LOG(Debug, "directory ready: {}", path.string());
  }

  if (options.database) {
    options.database->open(options.data_root);
    std::lock_guard<std::mutex> lock(mutex_);
    database_ = options.database;
  }
}

void ServiceOrchestrator::stopInfrastructure() {
  DatabasePtr database;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    database.swap(database_);
  }
  if (database) {
    database->close();
  }
}

void ServiceOrchestrator::startProcessPool(const OrchestratorOptions& options) {
  auto pool = std::make_unique<process::ProcessPool>(options.pool);
  pool_subscription_ = pool->events().subscribe(
      [this](const process::ProcessEvent& event) {
        process_events_.emit(event);
      });

  std::lock_guard<std::mutex> lock(mutex_);
  pool_ = std::move(pool);
}

void ServiceOrchestrator::stopProcessPool() {
  std::unique_ptr<process::ProcessPool> pool;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pool.swap(pool_);
  }
  if (!pool) {
    return;
  }
  pool->events().unsubscribe(pool_subscription_);
  pool->shutdown();
}

void ServiceOrchestrator::startConnections(const OrchestratorOptions& options) {
  process::ProcessPool* pool;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pool = pool_.get();
  }
  if (!pool) {
    throw NotInitializedError("process pool");
  }

  connection::ToolProtocolPtr protocol =
      options.protocol_factory
          ? options.protocol_factory(*pool)
          : std::make_shared<connection::StdioToolProtocol>(*pool);
  auto manager = std::make_unique<connection::ServerConnectionManager>(
      *pool, protocol, options.connections);
  server_subscription_ = manager->events().subscribe(
      [this](const connection::ServerEvent& event) {
        server_events_.emit(event);
      });

  std::vector<connection::ServerConfig> enabled;
  std::copy_if(options.servers.begin(), options.servers.end(),
               std::back_inserter(enabled),
               [](const connection::ServerConfig& c) { return c.enabled; });

  std::vector<std::pair<std::string, std::future<void>>> pending;
  for (const auto& config : enabled) {
    connection::ServerConnectionManager* target = manager.get();
    pending.emplace_back(config.id,
                         std::async(std::launch::async, [target, config]() {
                           target->connect(config);
                         }));
  }

  size_t failures = 0;
  for (auto& entry : pending) {
    try {
      entry.second.get();
    } catch (const std::exception& e) {
      ++failures;
      WARDEN_LOG(Error, "server {} failed to connect: {}", entry.first,
                 e.what());
    }
  }

  if (!enabled.empty() && failures == enabled.size()) {
    manager->shutdown();
    manager->events().unsubscribe(server_subscription_);
    throw WardenError(errors::ConnectionFailed,
                      fmt::format("all {} servers failed to connect",
                                  enabled.size()));
  }
  WARDEN_LOG(Info, "{} of {} servers connected", enabled.size() - failures,
             enabled.size());

  std::lock_guard<std::mutex> lock(mutex_);
  protocol_ = std::move(protocol);
  manager_ = std::move(manager);
}

void ServiceOrchestrator::stopConnections() {
  std::unique_ptr<connection::ServerConnectionManager> manager;
  connection::ToolProtocolPtr protocol;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    manager.swap(manager_);
    protocol.swap(protocol_);
  }
  if (!manager) {
    return;
  }
  manager->shutdown();
  manager->events().unsubscribe(server_subscription_);
}

void ServiceOrchestrator::setStatus(const std::string& name,
                                    ServiceState state,
                                    const std::string& message) {
  ServiceStatus status;
  status.name = name;
  status.state = state;
  status.message = message;
  status.timestamp = std::chrono::system_clock::now();
  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    statuses_[name] = status;
  }
  status_changes_.emit(status);
}

void ServiceOrchestrator::clearStatus(const std::string& name) {
  std::lock_guard<std::mutex> lock(status_mutex_);
  statuses_.erase(name);
}

void ServiceOrchestrator::emitLifecycle(LifecycleEvent::Type type) {
  LifecycleEvent event;
  event.type = type;
  event.timestamp = std::chrono::system_clock::now();
  lifecycle_.emit(event);
}

}  // namespace orchestrator
}  // namespace warden
