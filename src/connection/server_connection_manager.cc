#define WARDEN_LOG_COMPONENT "connection.manager"

#include "warden/connection/server_connection_manager.h"

#include <future>

#include <fmt/format.h>

#include "warden/core/error.h"
#include "warden/logging/log_macros.h"

namespace warden {
namespace connection {

const char* connectionStateToString(ConnectionState state) {
  switch (state) {
    case ConnectionState::Disconnected:
      return "disconnected";
    case ConnectionState::Connecting:
      return "connecting";
    case ConnectionState::Connected:
      return "connected";
    case ConnectionState::Error:
      return "error";
  }
  return "unknown";
}

const char* serverEventTypeToString(ServerEvent::Type type) {
  switch (type) {
    case ServerEvent::Type::Connected:
      return "connected";
    case ServerEvent::Type::Disconnected:
      return "disconnected";
    case ServerEvent::Type::Error:
      return "error";
  }
  return "unknown";
}

ServerConnectionManager::ServerConnectionManager(
    process::ProcessPool& pool,
    ToolProtocolPtr protocol,
    ConnectionManagerOptions options)
    : pool_(pool), protocol_(std::move(protocol)), options_(options) {
  subscription_ = pool_.events().subscribe(
      [this](const process::ProcessEvent& event) { onProcessEvent(event); });
}

ServerConnectionManager::~ServerConnectionManager() {
  pool_.events().unsubscribe(subscription_);
}

std::string ServerConnectionManager::processIdFor(
    const std::string& server_id) {
  return "mcp-" + server_id;
}

process::ProcessSpec ServerConnectionManager::toProcessSpec(
    const ServerConfig& config) {
  process::ProcessSpec spec;
  spec.id = processIdFor(config.id);
  spec.command = config.command;
  spec.args = config.args;
  spec.working_directory = config.working_directory;
  spec.env = config.env;
  spec.startup_timeout = config.timeout;
  spec.ready_line = config.ready_line;
  spec.auto_restart = config.retry_count > 0;
  spec.max_restarts = config.retry_count;
  return spec;
}

void ServerConnectionManager::connect(const ServerConfig& config) {
  if (config.id.empty()) {
    throw WardenError(errors::ConnectionFailed, "server config has no id");
  }

  const std::string process_id = processIdFor(config.id);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(config.id);
    if (it != servers_.end() &&
        it->second.connection.state == ConnectionState::Connected) {
      return;
    }
    Record& record = servers_[config.id];
    record.config = config;
    record.connection = ServerConnection();
    record.connection.server_id = config.id;
    record.connection.process_id = process_id;
    record.connection.state = ConnectionState::Connecting;
    record.pid = -1;
  }

  WARDEN_LOG(Info, "connecting to server {} ({})", config.id, config.command);

  process::ManagedProcess process;
  try {
    process = pool_.getOrCreate(toProcessSpec(config)).get();
  } catch (const std::exception& e) {
    markError(config.id, e.what());
    throw;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(config.id);
    if (it == servers_.end()) {
      throw WardenError(errors::ConnectionFailed,
                        "server " + config.id + " was disconnected");
    }
    it->second.pid = process.pid;
  }

  auto tools = makeError<std::vector<ToolDescriptor>>(
      errors::ConnectionFailed, "tool discovery did not run");
  try {
    tools = protocol_->discoverTools(config, process);
  } catch (const std::exception& e) {
    markError(config.id, fmt::format("tool discovery failed: {}", e.what()));
    throw;
  }
  if (is_error(tools)) {
    const Error& error = get_error(tools);
    std::string message =
        fmt::format("tool discovery failed: {}", error.message);
    markError(config.id, message);
    throw WardenError(errors::ConnectionFailed, message);
  }

  // Exits reaped before the pid was recorded only show up in the pool
  if (!pool_.isHealthy(process_id)) {
    std::string message =
        fmt::format("process {} stopped during connect", process_id);
    markError(config.id, message);
    throw WardenError(errors::ConnectionFailed, message);
  }

  size_t tool_count = get_value(tools).size();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(config.id);
    if (it == servers_.end()) {
      throw WardenError(errors::ConnectionFailed,
                        "server " + config.id + " was disconnected");
    }
    if (it->second.connection.state != ConnectionState::Connecting) {
      throw WardenError(errors::ConnectionFailed,
                        fmt::format("server {} failed during connect: {}",
                                    config.id,
                                    it->second.connection.last_error));
    }
    it->second.connection.state = ConnectionState::Connected;
    it->second.connection.connected_at = std::chrono::system_clock::now();
    it->second.connection.tools = get_value(tools);
    it->second.connection.tools_fetched_at = std::chrono::steady_clock::now();
  }

  WARDEN_LOG(Info, "server {} connected (pid {}, {} tools)", config.id,
             process.pid, tool_count);
  emit(ServerEvent::Type::Connected, config.id, std::string(), tool_count);
}

void ServerConnectionManager::disconnect(const std::string& server_id) {
  std::string process_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(server_id);
    if (it == servers_.end()) {
      return;
    }
    process_id = it->second.connection.process_id;
  }

  WARDEN_LOG(Info, "disconnecting server {}", server_id);
  pool_.terminate(process_id).get();
  protocol_->release(process_id);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    servers_.erase(server_id);
  }
  emit(ServerEvent::Type::Disconnected, server_id);
}

std::vector<ToolDescriptor> ServerConnectionManager::discoverTools(
    const std::string& server_id, bool refresh) {
  ServerConfig config;
  std::string process_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(server_id);
    if (it == servers_.end() ||
        it->second.connection.state != ConnectionState::Connected) {
      throw ServerNotConnectedError(server_id);
    }
    const ServerConnection& connection = it->second.connection;
    auto age = std::chrono::steady_clock::now() - connection.tools_fetched_at;
    if (!refresh && age < options_.tool_cache_ttl) {
      return connection.tools;
    }
    config = it->second.config;
    process_id = connection.process_id;
  }

  auto process = pool_.get(process_id);
  if (!process || !pool_.isHealthy(process_id)) {
    markError(server_id, "backing process is not running");
    throw ServerNotConnectedError(server_id);
  }

  auto tools = protocol_->discoverTools(config, *process);
  if (is_error(tools)) {
    throw WardenError(errors::ConnectionFailed,
                      fmt::format("tool discovery on {} failed: {}", server_id,
                                  get_error(tools).message));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = servers_.find(server_id);
  if (it != servers_.end()) {
    it->second.connection.tools = get_value(tools);
    it->second.connection.tools_fetched_at = std::chrono::steady_clock::now();
  }
  return get_value(tools);
}

nlohmann::json ServerConnectionManager::callTool(
    const std::string& server_id,
    const std::string& tool_name,
    const nlohmann::json& arguments) {
  ServerConfig config;
  std::string process_id;
  if (!lookupConnected(server_id, config, process_id)) {
    throw ServerNotConnectedError(server_id);
  }

  // The connection may not have noticed the process dying yet
  auto process = pool_.get(process_id);
  if (!process || !pool_.isHealthy(process_id)) {
    WARDEN_LOG(Warning, "server {} lost its process", server_id);
    markError(server_id, "backing process is not running");
    throw ServerNotConnectedError(server_id);
  }

  WARDEN_LOG(Debug, "calling {} on {}", tool_name, server_id);
  auto result = protocol_->callTool(config, *process, tool_name, arguments);
  if (is_error(result)) {
    const Error& error = get_error(result);
    WARDEN_LOG(Warning, "tool {} on {} failed: {}", tool_name, server_id,
               error.message);
    throw WardenError(errors::InvocationFailed, error.message);
  }
  return get_value(result);
}

std::vector<ServerConnection> ServerConnectionManager::listConnected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ServerConnection> result;
  for (const auto& kv : servers_) {
    if (kv.second.connection.state == ConnectionState::Connected) {
      result.push_back(kv.second.connection);
    }
  }
  return result;
}

optional<ServerConnection> ServerConnectionManager::getConnection(
    const std::string& server_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = servers_.find(server_id);
  if (it == servers_.end()) {
    return nullopt;
  }
  return it->second.connection;
}

void ServerConnectionManager::shutdown() {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : servers_) {
      ids.push_back(kv.first);
    }
  }

  WARDEN_LOG(Info, "disconnecting {} servers", ids.size());

  std::vector<std::pair<std::string, std::future<void>>> pending;
  for (const auto& id : ids) {
    pending.emplace_back(
        id, std::async(std::launch::async, [this, id]() { disconnect(id); }));
  }
  for (auto& entry : pending) {
    try {
      entry.second.get();
    } catch (const std::exception& e) {
      WARDEN_LOG(Error, "failed to disconnect {}: {}", entry.first, e.what());
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  servers_.clear();
}

bool ServerConnectionManager::lookupConnected(const std::string& server_id,
                                              ServerConfig& config,
                                              std::string& process_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = servers_.find(server_id);
  if (it == servers_.end() ||
      it->second.connection.state != ConnectionState::Connected) {
    return false;
  }
  config = it->second.config;
  process_id = it->second.connection.process_id;
  return true;
}

void ServerConnectionManager::markError(const std::string& server_id,
                                        const std::string& message) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(server_id);
    if (it == servers_.end() ||
        it->second.connection.state == ConnectionState::Error) {
      return;
    }
    it->second.connection.state = ConnectionState::Error;
    it->second.connection.last_error = message;
  }
  WARDEN_LOG(Error, "server {}: {}", server_id, message);
  emit(ServerEvent::Type::Error, server_id, message);
}

void ServerConnectionManager::onProcessEvent(
    const process::ProcessEvent& event) {
  if (event.type != process::ProcessEvent::Type::Exited &&
      event.type != process::ProcessEvent::Type::Error) {
    return;
  }

  std::string server_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : servers_) {
      if (kv.second.connection.process_id == event.process_id &&
          (kv.second.connection.state == ConnectionState::Connected ||
           (kv.second.connection.state == ConnectionState::Connecting &&
            event.pid > 0 && kv.second.pid == event.pid))) {
        server_id = kv.first;
        break;
      }
    }
  }
  if (server_id.empty()) {
    return;
  }

  std::string message = fmt::format("process {}", event.message.empty()
                                                      ? "exited"
                                                      : event.message);
  markError(server_id, message);
}

void ServerConnectionManager::emit(ServerEvent::Type type,
                                   const std::string& server_id,
                                   const std::string& message,
                                   size_t tool_count) {
  ServerEvent event;
  event.type = type;
  event.server_id = server_id;
  event.message = message;
  event.tool_count = tool_count;
  events_.emit(event);
}

}  // namespace connection
}  // namespace warden
