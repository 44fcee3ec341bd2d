#ifndef WARDEN_CONFIG_CONFIG_LOADER_H
#define WARDEN_CONFIG_CONFIG_LOADER_H

#include <string>
#include <vector>

#include "warden/config/parse_error.h"
#include "warden/connection/server_config.h"
#include "warden/logging/log_level.h"
#include "warden/orchestrator/service_orchestrator.h"
#include "warden/process/process_pool.h"

namespace warden {
namespace config {

/**
 * @brief Everything the supervisor reads from its configuration file
 *
 * Example:
 *   log_level: info
 *   log_file: ${WARDEN_HOME:-/var/lib/warden}/logs/warden.log
 *   data_root: ${WARDEN_HOME:-/var/lib/warden}
 *   pool:
 *     health_interval_ms: 30000
 *     grace_period_ms: 2000
 *   servers:
 *     - id: files
 *       command: node
 *       args: [server.js]
 *       env: {ROOT: /srv}
 */
struct WardenConfig {
  logging::LogLevel log_level{logging::LogLevel::Info};
  // Empty logs to stderr
  std::string log_file;
  // "default" or "json"
  std::string log_format{"default"};
  std::string data_root{"."};
  std::vector<std::string> directories{"logs", "cache", "workspace", "temp"};
  process::PoolOptions pool;
  std::vector<connection::ServerConfig> servers;
};

/**
 * @brief Expand ${VAR} and ${VAR:-default} from the environment
 * @throws ConfigParseError for an undefined variable without default
 */
std::string substituteEnvironment(const std::string& content,
                                  const std::string& file = "");

/**
 * @brief Parse YAML (or JSON) text after environment substitution
 * @throws ConfigParseError on syntax errors and invalid values
 */
WardenConfig parseConfig(const std::string& content,
                         const std::string& file = "");

/**
 * @brief Read and parse a configuration file
 * @throws ConfigParseError if the file cannot be read or parsed
 */
WardenConfig loadConfigFile(const std::string& path);

// Point the logger registry at the configured level, sink and format
void applyLogging(const WardenConfig& config);

orchestrator::OrchestratorOptions toOrchestratorOptions(
    const WardenConfig& config);

}  // namespace config
}  // namespace warden

#endif  // WARDEN_CONFIG_CONFIG_LOADER_H
