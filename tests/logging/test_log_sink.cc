#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "warden/logging/log_sink.h"

namespace warden {
namespace logging {
namespace {

namespace fs = std::filesystem;

LogRecord makeRecord(const std::string& message,
                     LogLevel level = LogLevel::Info) {
  LogRecord record;
  record.level = level;
  record.logger = "process.pool";
  record.message = message;
  record.file = "/src/warden/src/process/process_pool.cc";
  record.line = 42;
  return record;
}

size_t countLines(const fs::path& path) {
  std::ifstream in(path);
  size_t lines = 0;
  std::string line;
  while (std::getline(in, line)) {
    ++lines;
  }
  return lines;
}

TEST(LogLevelTest, ParsesNamesIgnoringCase) {
  EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
  EXPECT_EQ(parseLogLevel("INFO"), LogLevel::Info);
  EXPECT_EQ(parseLogLevel("Warn"), LogLevel::Warning);
  EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warning);
  EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
  EXPECT_FALSE(parseLogLevel("verbose").has_value());
  EXPECT_STREQ(logLevelName(LogLevel::Error), "ERROR");
}

TEST(FormatterTest, TextLineCarriesLevelLoggerAndLocation) {
  std::string line = TextFormatter().format(makeRecord("child exited"));
  EXPECT_NE(line.find("[INFO]"), std::string::npos);
  EXPECT_NE(line.find("[process.pool]"), std::string::npos);
  EXPECT_NE(line.find("[process_pool.cc:42]"), std::string::npos);
  EXPECT_EQ(line.find('\n'), std::string::npos);
  EXPECT_EQ(line.substr(line.size() - 12), "child exited");
}

TEST(FormatterTest, JsonLineIsParseable) {
  auto record = makeRecord("said \"hi\"\nand left\t\x01", LogLevel::Warning);
  std::string line = JsonFormatter().format(record);
  EXPECT_EQ(line.find('\n'), std::string::npos);

  auto parsed = nlohmann::json::parse(line);
  EXPECT_EQ(parsed["level"], "WARNING");
  EXPECT_EQ(parsed["logger"], "process.pool");
  EXPECT_EQ(parsed["message"], record.message);
  EXPECT_EQ(parsed["file"], "process_pool.cc");
  EXPECT_EQ(parsed["line"], 42);
}

TEST(FormatterTest, JsonSurvivesInvalidUtf8) {
  std::string line = JsonFormatter().format(makeRecord("bad \xff byte"));
  EXPECT_NO_THROW(nlohmann::json::parse(line));
}

TEST(FormatterTest, FactoryKnowsDefaultAndJson) {
  EXPECT_NE(createFormatter("default"), nullptr);
  EXPECT_NE(createFormatter("json"), nullptr);
  EXPECT_EQ(createFormatter("xml"), nullptr);
}

TEST(CallbackSinkTest, ReceivesFormattedLines) {
  std::vector<std::string> lines;
  CallbackSink sink([&lines](const LogRecord& record, const std::string& line) {
    EXPECT_EQ(record.logger, "process.pool");
    lines.push_back(line);
  });
  sink.setFormatter(std::make_unique<JsonFormatter>());

  sink.write(makeRecord("one"));
  sink.write(makeRecord("two"));
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(nlohmann::json::parse(lines[1])["message"], "two");

  // A null formatter keeps the current one
  sink.setFormatter(nullptr);
  sink.write(makeRecord("three"));
  EXPECT_EQ(nlohmann::json::parse(lines[2])["message"], "three");
}

class FileSinkTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("warden-log-" + std::to_string(::getpid()));
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  fs::path dir_;
};

TEST_F(FileSinkTest, AppendsLines) {
  FileSink::Options options;
  options.path = (dir_ / "warden.log").string();
  {
    FileSink sink(options);
    sink.write(makeRecord("first"));
    sink.write(makeRecord("second"));
  }
  {
    FileSink sink(options);
    sink.write(makeRecord("third"));
  }
  EXPECT_EQ(countLines(options.path), 3u);
}

TEST_F(FileSinkTest, RotatesBySize) {
  FileSink::Options options;
  options.path = (dir_ / "warden.log").string();
  options.max_bytes = 400;
  options.max_backups = 2;

  FileSink sink(options);
  for (int i = 0; i < 40; ++i) {
    sink.write(makeRecord("line " + std::to_string(i)));
  }
  sink.flush();

  EXPECT_TRUE(fs::exists(options.path));
  EXPECT_TRUE(fs::exists(options.path + ".1"));
  EXPECT_TRUE(fs::exists(options.path + ".2"));
  EXPECT_FALSE(fs::exists(options.path + ".3"));
  EXPECT_LE(fs::file_size(options.path), options.max_bytes);
}

TEST_F(FileSinkTest, UnopenableFileThrows) {
  FileSink::Options options;
  options.path = (dir_ / "missing" / "warden.log").string();
  EXPECT_THROW(FileSink sink(options), std::runtime_error);
}

}  // namespace
}  // namespace logging
}  // namespace warden
