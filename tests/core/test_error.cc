#include <string>

#include <gtest/gtest.h>

#include "warden/core/error.h"

using namespace warden;

TEST(ErrorTest, ResultHoldsValueOrError) {
  Result<int> ok = makeSuccess(42);
  EXPECT_FALSE(is_error(ok));
  EXPECT_EQ(get_value(ok), 42);

  Result<int> failed = makeError<int>(errors::SpawnFailed, "no such file");
  ASSERT_TRUE(is_error(failed));
  EXPECT_EQ(get_error(failed).code, errors::SpawnFailed);
  EXPECT_EQ(get_error(failed).message, "no such file");
}

TEST(ErrorTest, VoidResult) {
  EXPECT_FALSE(is_error(makeVoidSuccess()));
  auto failed = makeVoidError(Error(errors::ProtocolError, "bad frame"));
  ASSERT_TRUE(is_error(failed));
  EXPECT_EQ(get_error(failed).code, errors::ProtocolError);
}

TEST(ErrorTest, CodeNames) {
  EXPECT_STREQ(errorCodeToString(errors::StartupTimeout), "startup timeout");
  EXPECT_STREQ(errorCodeToString(errors::ServerNotConnected),
               "server not connected");
  EXPECT_STREQ(errorCodeToString(-5), "unknown error");
}

TEST(ErrorTest, NotInitializedIsWardenError) {
  try {
    throw NotInitializedError("process pool");
  } catch (const WardenError& e) {
    EXPECT_EQ(e.code(), errors::NotInitialized);
    EXPECT_STREQ(e.what(), "process pool is not initialized");
  }
}

TEST(ErrorTest, ServerNotConnectedCarriesId) {
  ServerNotConnectedError error("files");
  EXPECT_EQ(error.code(), errors::ServerNotConnected);
  EXPECT_EQ(error.serverId(), "files");
  EXPECT_NE(std::string(error.what()).find("files"), std::string::npos);

  // Distinguishable from a generic failure by type
  EXPECT_THROW(throw error, ServerNotConnectedError);
}
