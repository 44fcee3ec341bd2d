#ifndef WARDEN_CONNECTION_STDIO_TOOL_PROTOCOL_H
#define WARDEN_CONNECTION_STDIO_TOOL_PROTOCOL_H

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "warden/connection/tool_protocol.h"
#include "warden/process/process_pool.h"

namespace warden {
namespace connection {

/**
 * @brief JSON-RPC 2.0 over the stdio pipes of pooled processes
 *
 * Messages are single-line JSON documents terminated by a newline. Each
 * process gets an initialize/initialized handshake before its first request;
 * a new pid under the same process id gets a fresh handshake.
 *
 * Requests block the calling thread, so they must not be issued from the
 * pool's dispatcher thread.
 */
class StdioToolProtocol : public ToolProtocol {
 public:
  struct Options {
    std::chrono::milliseconds request_timeout{30000};
    std::string client_name{"warden"};
    std::string client_version{"1.0.0"};
    std::string protocol_version{"2024-11-05"};
  };

  explicit StdioToolProtocol(process::ProcessPool& pool)
      : StdioToolProtocol(pool, Options()) {}
  StdioToolProtocol(process::ProcessPool& pool, Options options);
  ~StdioToolProtocol() override;

  Result<std::vector<ToolDescriptor>> discoverTools(
      const ServerConfig& config,
      const process::ManagedProcess& process) override;

  Result<nlohmann::json> callTool(const ServerConfig& config,
                                  const process::ManagedProcess& process,
                                  const std::string& tool_name,
                                  const nlohmann::json& arguments) override;

  void release(const std::string& process_id) override;

 private:
  using RequestKey = std::pair<std::string, int64_t>;
  using ResponsePromise = std::shared_ptr<std::promise<nlohmann::json>>;

  VoidResult ensureSession(const process::ManagedProcess& process);
  Result<nlohmann::json> request(const process::ManagedProcess& process,
                                 const std::string& method,
                                 const nlohmann::json& params);
  VoidResult notify(const process::ManagedProcess& process,
                    const std::string& method);

  void onOutput(const process::ProcessOutput& output);
  void onProcessEvent(const process::ProcessEvent& event);
  void failPending(const std::string& process_id, const std::string& reason);

  process::ProcessPool& pool_;
  Options options_;
  uint64_t output_subscription_{0};
  uint64_t event_subscription_{0};

  // Serializes handshakes
  std::mutex session_mutex_;

  std::mutex mutex_;
  int64_t next_request_id_{1};
  std::map<RequestKey, ResponsePromise> pending_;
  // process id -> pid the handshake was done with
  std::map<std::string, pid_t> sessions_;
};

}  // namespace connection
}  // namespace warden

#endif  // WARDEN_CONNECTION_STDIO_TOOL_PROTOCOL_H
