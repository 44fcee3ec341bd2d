#include <signal.h>

#include <chrono>
#include <thread>

#include <gtest/gtest.h>

#include "warden/connection/stdio_tool_protocol.h"
#include "warden/core/error.h"

#ifndef WARDEN_FAKE_TOOL_SERVER
#error "WARDEN_FAKE_TOOL_SERVER must name the fake tool server binary"
#endif

namespace warden {
namespace connection {
namespace {

using namespace std::chrono_literals;

class StdioToolProtocolTest : public ::testing::Test {
 protected:
  void SetUp() override {
    process::PoolOptions pool_options;
    pool_options.reap_interval = 20ms;
    pool_ = std::make_unique<process::ProcessPool>(pool_options);

    StdioToolProtocol::Options options;
    options.request_timeout = 3000ms;
    protocol_ = std::make_unique<StdioToolProtocol>(*pool_, options);

    config_.id = "fake";
    config_.command = WARDEN_FAKE_TOOL_SERVER;
    config_.retry_count = 0;
  }

  void TearDown() override {
    protocol_.reset();
    pool_->shutdown();
  }

  process::ManagedProcess start() {
    process::ProcessSpec spec;
    spec.id = "mcp-fake";
    spec.command = config_.command;
    return pool_->getOrCreate(spec).get();
  }

  std::unique_ptr<process::ProcessPool> pool_;
  std::unique_ptr<StdioToolProtocol> protocol_;
  ServerConfig config_;
};

TEST_F(StdioToolProtocolTest, HandshakeThenListTools) {
  auto process = start();

  auto tools = protocol_->discoverTools(config_, process);
  ASSERT_FALSE(is_error(tools)) << get_error(tools).message;
  ASSERT_EQ(get_value(tools).size(), 1u);
  EXPECT_EQ(get_value(tools)[0]["name"], "echo");
}

TEST_F(StdioToolProtocolTest, CallToolReturnsResult) {
  auto process = start();

  auto result =
      protocol_->callTool(config_, process, "echo", {{"text", "hello"}});
  ASSERT_FALSE(is_error(result)) << get_error(result).message;
  EXPECT_EQ(get_value(result)["content"][0]["text"], "hello");

  // The session is reused for further calls
  auto again =
      protocol_->callTool(config_, process, "echo", {{"text", "again"}});
  ASSERT_FALSE(is_error(again));
  EXPECT_EQ(get_value(again)["content"][0]["text"], "again");
}

TEST_F(StdioToolProtocolTest, DefaultOptions) {
  protocol_.reset();
  StdioToolProtocol protocol(*pool_);
  auto process = start();

  auto tools = protocol.discoverTools(config_, process);
  ASSERT_FALSE(is_error(tools)) << get_error(tools).message;
  EXPECT_EQ(get_value(tools).size(), 1u);
}

TEST_F(StdioToolProtocolTest, StoppedPoolIsReportedAsResult) {
  auto process = start();
  pool_->shutdown();

  Result<nlohmann::json> result = nlohmann::json();
  EXPECT_NO_THROW(result = protocol_->callTool(config_, process, "echo",
                                               {{"text", "late"}}));
  ASSERT_TRUE(is_error(result));
  EXPECT_EQ(get_error(result).code, errors::InvocationFailed);
}

TEST_F(StdioToolProtocolTest, ToolErrorIsInvocationFailure) {
  auto process = start();

  auto result =
      protocol_->callTool(config_, process, "fail", nlohmann::json::object());
  ASSERT_TRUE(is_error(result));
  EXPECT_EQ(get_error(result).code, errors::InvocationFailed);
  EXPECT_NE(get_error(result).message.find("tool broke"), std::string::npos);
}

TEST_F(StdioToolProtocolTest, RpcErrorIsProtocolError) {
  auto process = start();

  auto result =
      protocol_->callTool(config_, process, "missing", nlohmann::json::object());
  ASSERT_TRUE(is_error(result));
  EXPECT_EQ(get_error(result).code, errors::ProtocolError);
}

TEST_F(StdioToolProtocolTest, UnansweredRequestTimesOut) {
  StdioToolProtocol::Options options;
  options.request_timeout = 300ms;
  protocol_ = std::make_unique<StdioToolProtocol>(*pool_, options);
  auto process = start();

  auto start_time = std::chrono::steady_clock::now();
  auto result =
      protocol_->callTool(config_, process, "slow", nlohmann::json::object());
  ASSERT_TRUE(is_error(result));
  EXPECT_EQ(get_error(result).code, errors::InvocationFailed);
  EXPECT_LT(std::chrono::steady_clock::now() - start_time, 3000ms);
}

TEST_F(StdioToolProtocolTest, ProcessDeathFailsPendingRequest) {
  auto process = start();
  ASSERT_FALSE(is_error(protocol_->discoverTools(config_, process)));

  std::thread killer([&]() {
    std::this_thread::sleep_for(200ms);
    ::kill(process.pid, SIGKILL);
  });
  auto start_time = std::chrono::steady_clock::now();
  auto result =
      protocol_->callTool(config_, process, "slow", nlohmann::json::object());
  killer.join();

  ASSERT_TRUE(is_error(result));
  EXPECT_LT(std::chrono::steady_clock::now() - start_time, 2500ms);
}

TEST_F(StdioToolProtocolTest, NewProcessGetsFreshHandshake) {
  auto first = start();
  ASSERT_FALSE(is_error(protocol_->discoverTools(config_, first)));

  pool_->terminate("mcp-fake").get();
  auto second = start();
  ASSERT_NE(first.pid, second.pid);

  // Without a new handshake the server would answer "not initialized"
  auto tools = protocol_->discoverTools(config_, second);
  ASSERT_FALSE(is_error(tools)) << get_error(tools).message;
  EXPECT_EQ(get_value(tools).size(), 1u);
}

TEST_F(StdioToolProtocolTest, ReleaseForgetsSession) {
  auto process = start();
  ASSERT_FALSE(is_error(protocol_->discoverTools(config_, process)));

  protocol_->release("mcp-fake");
  pool_->terminate("mcp-fake").get();

  auto replacement = start();
  auto tools = protocol_->discoverTools(config_, replacement);
  EXPECT_FALSE(is_error(tools));
}

}  // namespace
}  // namespace connection
}  // namespace warden
