#define WARDEN_LOG_COMPONENT "connection.protocol"

#include "warden/connection/stdio_tool_protocol.h"

#include <fmt/format.h>

#include "warden/logging/log_macros.h"

namespace warden {
namespace connection {

namespace {

std::string describeRpcError(const nlohmann::json& error) {
  if (error.is_object() && error.contains("message") &&
      error["message"].is_string()) {
    return error["message"].get<std::string>();
  }
  return error.dump();
}

// Text of the first text block of a tool result, if any
std::string firstText(const nlohmann::json& result) {
  auto content = result.find("content");
  if (content == result.end() || !content->is_array()) {
    return std::string();
  }
  for (const auto& block : *content) {
    if (block.is_object() && block.value("type", "") == "text" &&
        block.contains("text") && block["text"].is_string()) {
      return block["text"].get<std::string>();
    }
  }
  return std::string();
}

}  // namespace

StdioToolProtocol::StdioToolProtocol(process::ProcessPool& pool,
                                     Options options)
    : pool_(pool), options_(std::move(options)) {
  output_subscription_ = pool_.output().subscribe(
      [this](const process::ProcessOutput& output) { onOutput(output); });
  event_subscription_ = pool_.events().subscribe(
      [this](const process::ProcessEvent& event) { onProcessEvent(event); });
}

StdioToolProtocol::~StdioToolProtocol() {
  pool_.output().unsubscribe(output_subscription_);
  pool_.events().unsubscribe(event_subscription_);

  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& kv : pending_) {
    kv.second->set_exception(std::make_exception_ptr(
        WardenError(errors::InvocationFailed, "protocol shut down")));
  }
  pending_.clear();
}

Result<std::vector<ToolDescriptor>> StdioToolProtocol::discoverTools(
    const ServerConfig& config, const process::ManagedProcess& process) {
  auto session = ensureSession(process);
  if (is_error(session)) {
    return get_error(session);
  }

  auto response = request(process, "tools/list", nlohmann::json::object());
  if (is_error(response)) {
    return get_error(response);
  }

  const nlohmann::json& result = get_value(response);
  auto tools = result.find("tools");
  if (tools == result.end() || !tools->is_array()) {
    return Error(errors::ProtocolError,
                 fmt::format("server {} returned no tool list", config.id));
  }

  std::vector<ToolDescriptor> descriptors(tools->begin(), tools->end());
  WARDEN_LOG(Debug, "server {} offers {} tools", config.id,
             descriptors.size());
  return descriptors;
}

Result<nlohmann::json> StdioToolProtocol::callTool(
    const ServerConfig& config,
    const process::ManagedProcess& process,
    const std::string& tool_name,
    const nlohmann::json& arguments) {
  auto session = ensureSession(process);
  if (is_error(session)) {
    return get_error(session);
  }

  nlohmann::json params = {
      {"name", tool_name},
      {"arguments", arguments.is_null() ? nlohmann::json::object() : arguments}};
  auto response = request(process, "tools/call", params);
  if (is_error(response)) {
    return response;
  }

  const nlohmann::json& result = get_value(response);
  if (result.is_object() && result.value("isError", false)) {
    std::string text = firstText(result);
    return Error(errors::InvocationFailed,
                 fmt::format("tool {} on {} failed{}{}", tool_name, config.id,
                             text.empty() ? "" : ": ", text));
  }
  return response;
}

void StdioToolProtocol::release(const std::string& process_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(process_id);
  }
  failPending(process_id, "process released");
}

VoidResult StdioToolProtocol::ensureSession(
    const process::ManagedProcess& process) {
  std::lock_guard<std::mutex> session_lock(session_mutex_);
  const std::string& process_id = process.spec.id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(process_id);
    if (it != sessions_.end() && it->second == process.pid) {
      return makeVoidSuccess();
    }
  }

  nlohmann::json params = {
      {"protocolVersion", options_.protocol_version},
      {"capabilities", nlohmann::json::object()},
      {"clientInfo",
       {{"name", options_.client_name},
        {"version", options_.client_version}}}};
  auto response = request(process, "initialize", params);
  if (is_error(response)) {
    return makeVoidError(get_error(response));
  }

  auto notified = notify(process, "notifications/initialized");
  if (is_error(notified)) {
    return notified;
  }

  const nlohmann::json& result = get_value(response);
  std::string server_name = "unknown";
  if (result.is_object() && result.contains("serverInfo") &&
      result["serverInfo"].is_object()) {
    server_name = result["serverInfo"].value("name", server_name);
  }
  WARDEN_LOG(Info, "handshake with {} (pid {}) done, server {}", process_id,
             process.pid, server_name);

  std::lock_guard<std::mutex> lock(mutex_);
  sessions_[process_id] = process.pid;
  return makeVoidSuccess();
}

Result<nlohmann::json> StdioToolProtocol::request(
    const process::ManagedProcess& process,
    const std::string& method,
    const nlohmann::json& params) {
  const std::string& process_id = process.spec.id;
  auto promise = std::make_shared<std::promise<nlohmann::json>>();
  auto future = promise->get_future();

  int64_t id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_request_id_++;
    pending_[RequestKey(process_id, id)] = promise;
  }

  nlohmann::json message = {
      {"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
  WARDEN_LOG(Debug, "-> {} {} #{}", process_id, method, id);

  try {
    pool_.writeInput(process_id, message.dump() + "\n");
  } catch (const std::exception& e) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(RequestKey(process_id, id));
    return Error(errors::InvocationFailed,
                 fmt::format("{} to {} failed: {}", method, process_id,
                             e.what()));
  }

  if (future.wait_for(options_.request_timeout) != std::future_status::ready) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(RequestKey(process_id, id));
    return Error(errors::InvocationFailed,
                 fmt::format("{} to {} timed out after {} ms", method,
                             process_id, options_.request_timeout.count()));
  }

  nlohmann::json response;
  try {
    response = future.get();
  } catch (const WardenError& e) {
    return Error(e.error());
  } catch (const std::exception& e) {
    return Error(errors::InvocationFailed,
                 fmt::format("{} to {} failed: {}", method, process_id,
                             e.what()));
  }

  if (response.contains("error")) {
    return Error(errors::ProtocolError,
                 fmt::format("{} to {} failed: {}", method, process_id,
                             describeRpcError(response["error"])));
  }
  if (!response.contains("result")) {
    return Error(errors::ProtocolError,
                 fmt::format("{} to {}: response has no result", method,
                             process_id));
  }
  return Result<nlohmann::json>(response["result"]);
}

VoidResult StdioToolProtocol::notify(const process::ManagedProcess& process,
                                     const std::string& method) {
  nlohmann::json message = {{"jsonrpc", "2.0"}, {"method", method}};
  try {
    pool_.writeInput(process.spec.id, message.dump() + "\n");
  } catch (const WardenError& e) {
    return makeVoidError(e.error());
  }
  return makeVoidSuccess();
}

void StdioToolProtocol::onOutput(const process::ProcessOutput& output) {
  if (output.stream != process::OutputStream::Stdout) {
    return;
  }

  // Servers may print plain log lines on stdout; only JSON is protocol
  auto message = nlohmann::json::parse(output.line, nullptr, false);
  if (message.is_discarded() || !message.is_object() ||
      message.contains("method")) {
    return;
  }
  auto id = message.find("id");
  if (id == message.end() || !id->is_number_integer()) {
    return;
  }

  ResponsePromise promise;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(RequestKey(output.process_id, id->get<int64_t>()));
    if (it == pending_.end()) {
      WARDEN_LOG(Debug, "unmatched response #{} from {}", id->get<int64_t>(),
                 output.process_id);
      return;
    }
    promise = it->second;
    pending_.erase(it);
  }
  promise->set_value(std::move(message));
}

void StdioToolProtocol::onProcessEvent(const process::ProcessEvent& event) {
  if (event.type == process::ProcessEvent::Type::Created) {
    return;
  }
  failPending(event.process_id,
              fmt::format("process {} {}", event.process_id,
                          process::processEventTypeToString(event.type)));
}

void StdioToolProtocol::failPending(const std::string& process_id,
                                    const std::string& reason) {
  std::vector<ResponsePromise> failed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.lower_bound(RequestKey(process_id, 0));
    while (it != pending_.end() && it->first.first == process_id) {
      failed.push_back(it->second);
      it = pending_.erase(it);
    }
  }
  for (auto& promise : failed) {
    promise->set_exception(std::make_exception_ptr(
        WardenError(errors::InvocationFailed, reason)));
  }
}

}  // namespace connection
}  // namespace warden
