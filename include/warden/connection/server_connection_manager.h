#ifndef WARDEN_CONNECTION_SERVER_CONNECTION_MANAGER_H
#define WARDEN_CONNECTION_SERVER_CONNECTION_MANAGER_H

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "warden/connection/server_config.h"
#include "warden/connection/tool_protocol.h"
#include "warden/core/compat.h"
#include "warden/core/event_channel.h"
#include "warden/process/process_pool.h"

namespace warden {
namespace connection {

struct ConnectionManagerOptions {
  // How long discovered tools are served from cache
  std::chrono::milliseconds tool_cache_ttl{300000};
};

/**
 * @brief Turns server configurations into live tool connections
 *
 * Each connection is backed by exactly one pooled process with id
 * "mcp-<server id>". Talking to the process is delegated to a ToolProtocol.
 */
class ServerConnectionManager {
 public:
  ServerConnectionManager(
      process::ProcessPool& pool,
      ToolProtocolPtr protocol,
      ConnectionManagerOptions options = ConnectionManagerOptions());
  ~ServerConnectionManager();

  ServerConnectionManager(const ServerConnectionManager&) = delete;
  ServerConnectionManager& operator=(const ServerConnectionManager&) = delete;

  /**
   * Start the backing process and discover its tools. Returns immediately
   * if the server is already connected.
   * @throws WardenError on failure; the connection is left in Error state
   */
  void connect(const ServerConfig& config);

  // Terminate the backing process and forget the server. Unknown ids are a
  // no-op.
  void disconnect(const std::string& server_id);

  /**
   * Tools of a connected server, from cache unless stale or refresh is set.
   * @throws ServerNotConnectedError if the server is not connected
   */
  std::vector<ToolDescriptor> discoverTools(const std::string& server_id,
                                            bool refresh = false);

  /**
   * @throws ServerNotConnectedError if the server is not connected or its
   * process has died
   * @throws WardenError(InvocationFailed) if the call itself fails
   */
  nlohmann::json callTool(const std::string& server_id,
                          const std::string& tool_name,
                          const nlohmann::json& arguments);

  std::vector<ServerConnection> listConnected() const;
  optional<ServerConnection> getConnection(const std::string& server_id) const;

  // Disconnect every server concurrently. Failures are logged.
  void shutdown();

  EventChannel<ServerEvent>& events() { return events_; }

  static std::string processIdFor(const std::string& server_id);
  static process::ProcessSpec toProcessSpec(const ServerConfig& config);

 private:
  struct Record {
    ServerConfig config;
    ServerConnection connection;
    // Process being connected to, set once the pool has started it
    pid_t pid{-1};
  };

  // Returns the config and process of a connected server
  bool lookupConnected(const std::string& server_id,
                       ServerConfig& config,
                       std::string& process_id) const;
  void markError(const std::string& server_id, const std::string& message);
  void onProcessEvent(const process::ProcessEvent& event);
  void emit(ServerEvent::Type type,
            const std::string& server_id,
            const std::string& message = std::string(),
            size_t tool_count = 0);

  process::ProcessPool& pool_;
  ToolProtocolPtr protocol_;
  ConnectionManagerOptions options_;
  uint64_t subscription_{0};

  // Never held while calling into the pool or the protocol
  mutable std::mutex mutex_;
  std::map<std::string, Record> servers_;

  EventChannel<ServerEvent> events_;
};

}  // namespace connection
}  // namespace warden

#endif  // WARDEN_CONNECTION_SERVER_CONNECTION_MANAGER_H
