#pragma once

#include <gmock/gmock.h>

#include "warden/connection/tool_protocol.h"

namespace warden {
namespace test {

using ::testing::_;
using ::testing::Return;

class MockToolProtocol : public connection::ToolProtocol {
 public:
  MOCK_METHOD(Result<std::vector<connection::ToolDescriptor>>,
              discoverTools,
              (const connection::ServerConfig& config,
               const process::ManagedProcess& process),
              (override));
  MOCK_METHOD(Result<nlohmann::json>,
              callTool,
              (const connection::ServerConfig& config,
               const process::ManagedProcess& process,
               const std::string& tool_name,
               const nlohmann::json& arguments),
              (override));
  MOCK_METHOD(void, release, (const std::string& process_id), (override));
};

}  // namespace test
}  // namespace warden
