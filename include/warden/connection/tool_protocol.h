#ifndef WARDEN_CONNECTION_TOOL_PROTOCOL_H
#define WARDEN_CONNECTION_TOOL_PROTOCOL_H

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "warden/connection/server_config.h"
#include "warden/core/error.h"
#include "warden/process/process_types.h"

namespace warden {
namespace connection {

/**
 * @brief Speaks the tool protocol to a running server process
 *
 * The connection manager owns process lifetime and connection state; an
 * implementation only exchanges messages with a process that is already
 * running. Failures are returned, not thrown.
 */
class ToolProtocol {
 public:
  virtual ~ToolProtocol() = default;

  virtual Result<std::vector<ToolDescriptor>> discoverTools(
      const ServerConfig& config, const process::ManagedProcess& process) = 0;

  virtual Result<nlohmann::json> callTool(
      const ServerConfig& config,
      const process::ManagedProcess& process,
      const std::string& tool_name,
      const nlohmann::json& arguments) = 0;

  // Forget per-process state once the process is gone
  virtual void release(const std::string& process_id) { (void)process_id; }
};

using ToolProtocolPtr = std::shared_ptr<ToolProtocol>;

}  // namespace connection
}  // namespace warden

#endif  // WARDEN_CONNECTION_TOOL_PROTOCOL_H
