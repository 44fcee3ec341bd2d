#include "warden/logging/log_formatter.h"

#include <cstring>
#include <ctime>
#include <functional>
#include <iterator>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace warden {
namespace logging {

namespace {

std::string timestamp(std::chrono::system_clock::time_point time) {
  std::time_t seconds = std::chrono::system_clock::to_time_t(time);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    time.time_since_epoch())
                    .count() %
                1000;
  std::tm local;
  localtime_r(&seconds, &local);
  return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03}", local, millis);
}

const char* baseName(const char* path) {
  const char* slash = std::strrchr(path, '/');
  return slash ? slash + 1 : path;
}

size_t threadNumber(std::thread::id id) {
  return std::hash<std::thread::id>()(id) % 100000;
}

}  // namespace

std::string TextFormatter::format(const LogRecord& record) const {
  fmt::memory_buffer out;
  fmt::format_to(std::back_inserter(out), "{} [{}] [T:{}] [{}] ",
                 timestamp(record.time), logLevelName(record.level),
                 threadNumber(record.thread), record.logger);
  if (record.file) {
    fmt::format_to(std::back_inserter(out), "[{}:{}] ", baseName(record.file),
                   record.line);
  }
  fmt::format_to(std::back_inserter(out), "{}", record.message);
  return fmt::to_string(out);
}

std::string JsonFormatter::format(const LogRecord& record) const {
  nlohmann::json line = {{"time", timestamp(record.time)},
                         {"level", logLevelName(record.level)},
                         {"logger", record.logger},
                         {"thread", threadNumber(record.thread)},
                         {"message", record.message}};
  if (record.file) {
    line["file"] = baseName(record.file);
    line["line"] = record.line;
  }
  // Child output is not guaranteed to be valid UTF-8
  return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::unique_ptr<Formatter> createFormatter(const std::string& name) {
  if (name == "default" || name == "text") {
    return std::make_unique<TextFormatter>();
  }
  if (name == "json") {
    return std::make_unique<JsonFormatter>();
  }
  return nullptr;
}

}  // namespace logging
}  // namespace warden
