#define WARDEN_LOG_COMPONENT "config"

#include "warden/config/config_loader.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>

#include <yaml-cpp/yaml.h>

#include "warden/logging/log_formatter.h"
#include "warden/logging/log_macros.h"
#include "warden/logging/log_sink.h"

namespace warden {
namespace config {

namespace {

int lineOf(const YAML::Node& node) {
  return node.Mark().is_null() ? -1 : node.Mark().line + 1;
}

template <typename T>
T scalar(const YAML::Node& node,
         const std::string& field,
         const std::string& file) {
  if (!node.IsScalar()) {
    throw ConfigParseError("expected a scalar value", field, file,
                           lineOf(node));
  }
  try {
    return node.as<T>();
  } catch (const YAML::Exception&) {
    throw ConfigParseError("invalid value '" + node.Scalar() + "'", field,
                           file, lineOf(node));
  }
}

std::chrono::milliseconds millis(const YAML::Node& node,
                                 const std::string& field,
                                 const std::string& file) {
  int64_t value = scalar<int64_t>(node, field, file);
  if (value < 0) {
    throw ConfigParseError("must not be negative", field, file, lineOf(node));
  }
  return std::chrono::milliseconds(value);
}

std::vector<std::string> stringList(const YAML::Node& node,
                                    const std::string& field,
                                    const std::string& file) {
  if (!node.IsSequence()) {
    throw ConfigParseError("expected a list", field, file, lineOf(node));
  }
  std::vector<std::string> result;
  for (size_t i = 0; i < node.size(); ++i) {
    result.push_back(scalar<std::string>(
        node[i], field + "[" + std::to_string(i) + "]", file));
  }
  return result;
}

std::map<std::string, std::string> stringMap(const YAML::Node& node,
                                             const std::string& field,
                                             const std::string& file) {
  if (!node.IsMap()) {
    throw ConfigParseError("expected a mapping", field, file, lineOf(node));
  }
  std::map<std::string, std::string> result;
  for (const auto& kv : node) {
    std::string key = kv.first.as<std::string>();
    result[key] = scalar<std::string>(kv.second, field + "." + key, file);
  }
  return result;
}

logging::LogLevel logLevelField(const YAML::Node& node,
                                const std::string& file) {
  std::string value = scalar<std::string>(node, "log_level", file);
  auto level = logging::parseLogLevel(value);
  if (!level) {
    throw ConfigParseError("unknown log level '" + value + "'", "log_level",
                           file, lineOf(node));
  }
  return *level;
}

void parsePool(const YAML::Node& node,
               process::PoolOptions& pool,
               const std::string& file) {
  if (!node.IsMap()) {
    throw ConfigParseError("expected a mapping", "pool", file, lineOf(node));
  }
  if (node["health_interval_ms"]) {
    pool.health_check_interval =
        millis(node["health_interval_ms"], "pool.health_interval_ms", file);
  }
  if (node["reap_interval_ms"]) {
    pool.reap_interval =
        millis(node["reap_interval_ms"], "pool.reap_interval_ms", file);
  }
  if (node["grace_period_ms"]) {
    pool.grace_period =
        millis(node["grace_period_ms"], "pool.grace_period_ms", file);
  }
  if (node["restart_delay_ms"]) {
    pool.restart_delay =
        millis(node["restart_delay_ms"], "pool.restart_delay_ms", file);
  }
  if (node["cleanup_pattern"]) {
    pool.cleanup_pattern = scalar<std::string>(node["cleanup_pattern"],
                                               "pool.cleanup_pattern", file);
  }
  if (node["cleanup_timeout_ms"]) {
    pool.cleanup_timeout =
        millis(node["cleanup_timeout_ms"], "pool.cleanup_timeout_ms", file);
  }
  if (pool.health_check_interval.count() == 0 ||
      pool.reap_interval.count() == 0) {
    throw ConfigParseError("sweep intervals must be positive", "pool", file,
                           lineOf(node));
  }
}

connection::ServerConfig parseServer(const YAML::Node& node,
                                     const std::string& default_id,
                                     const std::string& field,
                                     const std::string& file) {
  if (!node.IsMap()) {
    throw ConfigParseError("expected a mapping", field, file, lineOf(node));
  }

  connection::ServerConfig server;
  server.id = node["id"] ? scalar<std::string>(node["id"], field + ".id", file)
                         : default_id;
  if (server.id.empty()) {
    throw ConfigParseError("server needs an id", field + ".id", file,
                           lineOf(node));
  }
  server.name = node["name"]
                    ? scalar<std::string>(node["name"], field + ".name", file)
                    : server.id;
  if (node["command"]) {
    server.command =
        scalar<std::string>(node["command"], field + ".command", file);
  }
  if (node["args"]) {
    server.args = stringList(node["args"], field + ".args", file);
  }
  if (node["env"]) {
    server.env = stringMap(node["env"], field + ".env", file);
  }
  if (node["working_directory"]) {
    server.working_directory = scalar<std::string>(
        node["working_directory"], field + ".working_directory", file);
  }
  if (node["timeout"]) {
    server.timeout = millis(node["timeout"], field + ".timeout", file);
  }
  if (node["ready_line"]) {
    server.ready_line =
        scalar<std::string>(node["ready_line"], field + ".ready_line", file);
  }
  if (node["retry_count"]) {
    server.retry_count =
        scalar<uint32_t>(node["retry_count"], field + ".retry_count", file);
  }
  if (node["enabled"]) {
    server.enabled = scalar<bool>(node["enabled"], field + ".enabled", file);
  }
  return server;
}

// Accepts a list of servers with ids or a mapping keyed by id
std::vector<connection::ServerConfig> parseServers(const YAML::Node& node,
                                                   const std::string& file) {
  std::vector<connection::ServerConfig> servers;
  if (node.IsSequence()) {
    for (size_t i = 0; i < node.size(); ++i) {
      servers.push_back(parseServer(
          node[i], "", "servers[" + std::to_string(i) + "]", file));
    }
  } else if (node.IsMap()) {
    for (const auto& kv : node) {
      std::string id = kv.first.as<std::string>();
      servers.push_back(parseServer(kv.second, id, "servers." + id, file));
    }
  } else if (!node.IsNull()) {
    throw ConfigParseError("expected a list or mapping", "servers", file,
                           lineOf(node));
  }

  std::set<std::string> seen;
  for (const auto& server : servers) {
    if (!seen.insert(server.id).second) {
      throw ConfigParseError("duplicate server id '" + server.id + "'",
                             "servers", file, lineOf(node));
    }
  }
  return servers;
}

}  // namespace

std::string substituteEnvironment(const std::string& content,
                                  const std::string& file) {
  std::regex env_regex(R"(\$\{([A-Za-z_][A-Za-z0-9_]*)(:(-)?([^}]*))?\})");
  std::string result;
  size_t vars_expanded = 0;

  std::smatch match;
  std::string::const_iterator search_start(content.cbegin());
  while (std::regex_search(search_start, content.cend(), match, env_regex)) {
    std::string var_name = match[1].str();
    bool has_default = match[2].matched;
    std::string default_value = has_default ? match[4].str() : "";

    const char* env_value = std::getenv(var_name.c_str());
    if (!env_value && !has_default) {
      WARDEN_LOG(Error, "undefined environment variable without default: ${{{}}}",
                 var_name);
      throw ConfigParseError("undefined environment variable " + var_name, "",
                             file);
    }

    result.append(search_start, match[0].first);
    result.append(env_value ? env_value : default_value);
    ++vars_expanded;
    search_start = match[0].second;
  }
  result.append(search_start, content.cend());

  if (vars_expanded > 0) {
    WARDEN_LOG(Debug, "expanded {} environment variables", vars_expanded);
  }
  return result;
}

WardenConfig parseConfig(const std::string& content, const std::string& file) {
  std::string expanded = substituteEnvironment(content, file);

  YAML::Node root;
  try {
    root = YAML::Load(expanded);
  } catch (const YAML::ParserException& e) {
    std::ostringstream error;
    error << "YAML parse error at column " << e.mark.column + 1 << ": "
          << e.msg;
    throw ConfigParseError(error.str(), "", file, e.mark.line + 1);
  }

  WardenConfig config;
  if (root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw ConfigParseError("top level must be a mapping", "", file,
                           lineOf(root));
  }

  if (root["log_level"]) {
    config.log_level = logLevelField(root["log_level"], file);
  }
  if (root["log_file"]) {
    config.log_file = scalar<std::string>(root["log_file"], "log_file", file);
  }
  if (root["log_format"]) {
    config.log_format =
        scalar<std::string>(root["log_format"], "log_format", file);
    if (!logging::createFormatter(config.log_format)) {
      throw ConfigParseError("unknown format '" + config.log_format + "'",
                             "log_format", file, lineOf(root["log_format"]));
    }
  }
  if (root["data_root"]) {
    config.data_root =
        scalar<std::string>(root["data_root"], "data_root", file);
  }
  if (root["directories"]) {
    config.directories = stringList(root["directories"], "directories", file);
  }
  if (root["pool"]) {
    parsePool(root["pool"], config.pool, file);
  }
  if (root["servers"]) {
    config.servers = parseServers(root["servers"], file);
  }

  WARDEN_LOG(Debug, "configuration parsed: {} servers", config.servers.size());
  return config;
}

WardenConfig loadConfigFile(const std::string& path) {
  std::ifstream input(path);
  if (!input) {
    throw ConfigParseError("cannot open file", "", path);
  }
  std::stringstream buffer;
  buffer << input.rdbuf();

  WARDEN_LOG(Info, "loading configuration from {}", path);
  return parseConfig(buffer.str(), path);
}

void applyLogging(const WardenConfig& config) {
  auto formatter = logging::createFormatter(config.log_format);
  if (!formatter) {
    throw ConfigParseError("unknown format '" + config.log_format + "'",
                           "log_format");
  }

  logging::LogSinkPtr sink;
  if (config.log_file.empty()) {
    sink = std::make_shared<logging::StdioSink>();
  } else {
    std::filesystem::path parent =
        std::filesystem::path(config.log_file).parent_path();
    if (!parent.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        throw ConfigParseError("cannot create log directory: " + ec.message(),
                               "log_file");
      }
    }
    logging::FileSink::Options options;
    options.path = config.log_file;
    try {
      sink = std::make_shared<logging::FileSink>(options);
    } catch (const std::runtime_error& e) {
      throw ConfigParseError(e.what(), "log_file");
    }
  }
  sink->setFormatter(std::move(formatter));

  auto& registry = logging::LoggerRegistry::instance();
  registry.setSink(sink);
  registry.setLevel(config.log_level);
}

orchestrator::OrchestratorOptions toOrchestratorOptions(
    const WardenConfig& config) {
  orchestrator::OrchestratorOptions options;
  options.data_root = config.data_root;
  options.directories = config.directories;
  options.pool = config.pool;
  options.servers = config.servers;
  return options;
}

}  // namespace config
}  // namespace warden
