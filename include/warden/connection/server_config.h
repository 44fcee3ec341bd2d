#ifndef WARDEN_CONNECTION_SERVER_CONFIG_H
#define WARDEN_CONNECTION_SERVER_CONFIG_H

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace warden {
namespace connection {

// Tool descriptors and results are passed through untouched
using ToolDescriptor = nlohmann::json;

/**
 * @brief Configuration of one tool server
 */
struct ServerConfig {
  std::string id;
  std::string name;
  std::string command{"node"};
  std::vector<std::string> args;
  std::map<std::string, std::string> env;
  std::string working_directory;
  // Startup timeout of the backing process
  std::chrono::milliseconds timeout{15000};
  // Stdout text that signals the server is up; empty to start on exec
  std::string ready_line;
  // Automatic restarts allowed for the backing process
  uint32_t retry_count{3};
  bool enabled{true};
};

enum class ConnectionState { Disconnected, Connecting, Connected, Error };

const char* connectionStateToString(ConnectionState state);

/**
 * @brief Snapshot of a server's connection
 */
struct ServerConnection {
  std::string server_id;
  std::string process_id;
  ConnectionState state{ConnectionState::Disconnected};
  std::chrono::system_clock::time_point connected_at;
  std::string last_error;
  std::vector<ToolDescriptor> tools;
  std::chrono::steady_clock::time_point tools_fetched_at;
};

struct ServerEvent {
  enum class Type { Connected, Disconnected, Error };

  Type type{Type::Connected};
  std::string server_id;
  std::string message;
  size_t tool_count{0};
};

const char* serverEventTypeToString(ServerEvent::Type type);

}  // namespace connection
}  // namespace warden

#endif  // WARDEN_CONNECTION_SERVER_CONFIG_H
