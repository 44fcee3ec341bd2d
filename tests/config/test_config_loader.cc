#include <stdlib.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

#include "warden/config/config_loader.h"

namespace warden {
namespace config {
namespace {

using namespace std::chrono_literals;
namespace fs = std::filesystem;

class ConfigLoaderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ::unsetenv("WARDEN_TEST_HOME");
    ::unsetenv("WARDEN_TEST_MISSING");
  }

  void TearDown() override {
    ::unsetenv("WARDEN_TEST_HOME");
    if (!temp_file_.empty()) {
      std::error_code ec;
      fs::remove(temp_file_, ec);
    }
  }

  std::string writeTemp(const std::string& content) {
    temp_file_ = (fs::temp_directory_path() /
                  ("warden-config-" + std::to_string(::getpid()) + ".yaml"))
                     .string();
    std::ofstream out(temp_file_);
    out << content;
    return temp_file_;
  }

  std::string temp_file_;
};

TEST_F(ConfigLoaderTest, EmptyDocumentGivesDefaults) {
  WardenConfig config = parseConfig("");
  EXPECT_EQ(config.log_level, logging::LogLevel::Info);
  EXPECT_EQ(config.log_format, "default");
  EXPECT_EQ(config.data_root, ".");
  EXPECT_EQ(config.directories.size(), 4u);
  EXPECT_EQ(config.pool.health_check_interval, 30000ms);
  EXPECT_TRUE(config.servers.empty());
}

TEST_F(ConfigLoaderTest, ParsesFullDocument) {
  const char* yaml = R"(
log_level: debug
log_format: json
data_root: /srv/warden
directories: [logs, cache]
pool:
  health_interval_ms: 5000
  grace_period_ms: 750
  restart_delay_ms: 250
  cleanup_pattern: mcp-server
servers:
  - id: files
    name: File server
    command: node
    args: [server.js, --root, /srv]
    env:
      ROOT: /srv
    working_directory: /opt/files
    timeout: 20000
    retry_count: 5
    ready_line: listening
  - id: search
    command: python3
    enabled: false
)";
  WardenConfig config = parseConfig(yaml);

  EXPECT_EQ(config.log_level, logging::LogLevel::Debug);
  EXPECT_EQ(config.log_format, "json");
  EXPECT_EQ(config.data_root, "/srv/warden");
  EXPECT_EQ(config.directories, (std::vector<std::string>{"logs", "cache"}));
  EXPECT_EQ(config.pool.health_check_interval, 5000ms);
  EXPECT_EQ(config.pool.grace_period, 750ms);
  EXPECT_EQ(config.pool.restart_delay, 250ms);
  EXPECT_EQ(config.pool.cleanup_pattern, "mcp-server");

  ASSERT_EQ(config.servers.size(), 2u);
  const auto& files = config.servers[0];
  EXPECT_EQ(files.id, "files");
  EXPECT_EQ(files.name, "File server");
  EXPECT_EQ(files.command, "node");
  EXPECT_EQ(files.args.size(), 3u);
  EXPECT_EQ(files.env.at("ROOT"), "/srv");
  EXPECT_EQ(files.working_directory, "/opt/files");
  EXPECT_EQ(files.timeout, 20000ms);
  EXPECT_EQ(files.retry_count, 5u);
  EXPECT_EQ(files.ready_line, "listening");
  EXPECT_TRUE(files.enabled);

  const auto& search = config.servers[1];
  EXPECT_EQ(search.name, "search");
  EXPECT_EQ(search.timeout, 15000ms);
  EXPECT_EQ(search.retry_count, 3u);
  EXPECT_FALSE(search.enabled);
}

TEST_F(ConfigLoaderTest, ServersKeyedById) {
  WardenConfig config = parseConfig(R"(
servers:
  alpha:
    command: cat
  beta:
    command: node
)");
  ASSERT_EQ(config.servers.size(), 2u);
  EXPECT_EQ(config.servers[0].id, "alpha");
  EXPECT_EQ(config.servers[0].command, "cat");
  EXPECT_EQ(config.servers[1].id, "beta");
}

TEST_F(ConfigLoaderTest, DuplicateServerIdRejected) {
  try {
    parseConfig(R"(
servers:
  - id: a
  - id: a
)");
    FAIL() << "expected duplicate id error";
  } catch (const ConfigParseError& e) {
    EXPECT_EQ(e.field(), "servers");
    EXPECT_NE(e.reason().find("duplicate"), std::string::npos);
  }
}

TEST_F(ConfigLoaderTest, ServerWithoutIdRejected) {
  EXPECT_THROW(parseConfig("servers:\n  - command: cat\n"), ConfigParseError);
}

TEST_F(ConfigLoaderTest, InvalidValueReportsFieldAndLine) {
  try {
    parseConfig("log_level: info\ndata_root: /tmp\npool:\n"
                "  grace_period_ms: soon\n",
                "warden.yaml");
    FAIL() << "expected invalid value";
  } catch (const ConfigParseError& e) {
    EXPECT_EQ(e.field(), "pool.grace_period_ms");
    EXPECT_EQ(e.file(), "warden.yaml");
    EXPECT_EQ(e.line(), 4);
    EXPECT_EQ(e.code(), errors::ConfigInvalid);
    EXPECT_NE(std::string(e.what()).find("warden.yaml:4"), std::string::npos);
  }
}

TEST_F(ConfigLoaderTest, UnknownLogLevelRejected) {
  try {
    parseConfig("log_level: chatty\n");
    FAIL() << "expected unknown level";
  } catch (const ConfigParseError& e) {
    EXPECT_EQ(e.field(), "log_level");
  }
  EXPECT_EQ(parseConfig("log_level: WARNING\n").log_level,
            logging::LogLevel::Warning);
}

TEST_F(ConfigLoaderTest, UnknownLogFormatRejected) {
  EXPECT_THROW(parseConfig("log_format: xml\n"), ConfigParseError);
}

TEST_F(ConfigLoaderTest, BadIntervalsRejected) {
  EXPECT_THROW(parseConfig("pool:\n  restart_delay_ms: -5\n"),
               ConfigParseError);
  EXPECT_THROW(parseConfig("pool:\n  health_interval_ms: 0\n"),
               ConfigParseError);
}

TEST_F(ConfigLoaderTest, SyntaxErrorCarriesLocation) {
  try {
    parseConfig("servers:\n  - id: a\n    args: [unterminated\n", "bad.yaml");
    FAIL() << "expected syntax error";
  } catch (const ConfigParseError& e) {
    EXPECT_EQ(e.file(), "bad.yaml");
    EXPECT_GT(e.line(), 0);
  }
}

TEST_F(ConfigLoaderTest, EnvironmentSubstitution) {
  ::setenv("WARDEN_TEST_HOME", "/home/warden", 1);
  EXPECT_EQ(substituteEnvironment("root: ${WARDEN_TEST_HOME}/data"),
            "root: /home/warden/data");
  EXPECT_EQ(substituteEnvironment("port: ${WARDEN_TEST_MISSING:-8080}"),
            "port: 8080");
  EXPECT_EQ(substituteEnvironment("plain text"), "plain text");

  WardenConfig config =
      parseConfig("data_root: ${WARDEN_TEST_HOME:-/tmp}/state\n");
  EXPECT_EQ(config.data_root, "/home/warden/state");
}

TEST_F(ConfigLoaderTest, UndefinedVariableWithoutDefaultRejected) {
  try {
    substituteEnvironment("root: ${WARDEN_TEST_MISSING}", "env.yaml");
    FAIL() << "expected undefined variable error";
  } catch (const ConfigParseError& e) {
    EXPECT_EQ(e.file(), "env.yaml");
    EXPECT_NE(e.reason().find("WARDEN_TEST_MISSING"), std::string::npos);
  }
}

TEST_F(ConfigLoaderTest, LoadsFile) {
  std::string path = writeTemp("data_root: /var/warden\nservers: []\n");
  WardenConfig config = loadConfigFile(path);
  EXPECT_EQ(config.data_root, "/var/warden");

  EXPECT_THROW(loadConfigFile("/nonexistent/warden.yaml"), ConfigParseError);
}

TEST_F(ConfigLoaderTest, OrchestratorOptionsFromConfig) {
  WardenConfig config = parseConfig(R"(
data_root: /srv/warden
directories: [logs]
pool:
  grace_period_ms: 100
servers:
  - id: files
    command: cat
)");
  auto options = toOrchestratorOptions(config);
  EXPECT_EQ(options.data_root, "/srv/warden");
  EXPECT_EQ(options.directories, std::vector<std::string>{"logs"});
  EXPECT_EQ(options.pool.grace_period, 100ms);
  ASSERT_EQ(options.servers.size(), 1u);
  EXPECT_EQ(options.servers[0].id, "files");
  EXPECT_TRUE(options.install_default_phases);
}

}  // namespace
}  // namespace config
}  // namespace warden
