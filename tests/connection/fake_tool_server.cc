// Minimal newline-delimited JSON-RPC tool server used by the protocol tests.
//   echo  returns its "text" argument
//   fail  returns a tool error
//   slow  never answers

#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace {

void reply(const json& id, const json& result) {
  json response = {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
  std::cout << response.dump() << std::endl;
}

void replyError(const json& id, int code, const std::string& message) {
  json response = {{"jsonrpc", "2.0"},
                   {"id", id},
                   {"error", {{"code", code}, {"message", message}}}};
  std::cout << response.dump() << std::endl;
}

json textContent(const std::string& text) {
  return json::array({{{"type", "text"}, {"text", text}}});
}

}  // namespace

int main() {
  // Not protocol traffic; the client must skip it
  std::cout << "fake tool server ready" << std::endl;

  bool initialized = false;
  std::string line;
  while (std::getline(std::cin, line)) {
    json message = json::parse(line, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
      continue;
    }

    std::string method = message.value("method", "");
    if (!message.contains("id")) {
      if (method == "notifications/initialized") {
        initialized = true;
      }
      continue;
    }
    const json& id = message["id"];

    if (method == "initialize") {
      reply(id, {{"protocolVersion", "2024-11-05"},
                 {"capabilities", {{"tools", json::object()}}},
                 {"serverInfo", {{"name", "fake"}, {"version", "0.1"}}}});
    } else if (!initialized) {
      replyError(id, -32002, "not initialized");
    } else if (method == "tools/list") {
      reply(id, {{"tools",
                  json::array({{{"name", "echo"},
                                {"description", "Echo text back"},
                                {"inputSchema", {{"type", "object"}}}}})}});
    } else if (method == "tools/call") {
      const json& params = message["params"];
      std::string name = params.value("name", "");
      if (name == "echo") {
        std::string text = params["arguments"].value("text", "");
        reply(id, {{"content", textContent(text)}});
      } else if (name == "fail") {
        reply(id, {{"content", textContent("tool broke")}, {"isError", true}});
      } else if (name == "slow") {
        continue;
      } else {
        replyError(id, -32602, "unknown tool " + name);
      }
    } else {
      replyError(id, -32601, "method not found");
    }
  }
  return 0;
}
