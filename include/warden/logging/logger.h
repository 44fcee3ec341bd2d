#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "warden/logging/log_level.h"
#include "warden/logging/log_sink.h"

namespace warden {
namespace logging {

/**
 * @brief Named logger; level and sink are managed by the LoggerRegistry
 */
class Logger {
 public:
  explicit Logger(std::string name) : name_(std::move(name)) {}

  const std::string& name() const { return name_; }

  LogLevel level() const { return level_.load(std::memory_order_relaxed); }
  void setLevel(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
  }

  bool enabled(LogLevel level) const {
    return level != LogLevel::Off && level >= this->level();
  }

  void setSink(LogSinkPtr sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
  }

  template <typename... Args>
  void log(LogLevel level,
           const char* file,
           int line,
           fmt::format_string<Args...> format,
           Args&&... args) {
    if (!enabled(level)) {
      return;
    }
    LogRecord record;
    record.level = level;
    record.logger = name_;
    record.message = fmt::format(format, std::forward<Args>(args)...);
    record.file = file;
    record.line = line;
    write(record);
  }

  void write(const LogRecord& record) {
    LogSinkPtr sink;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      sink = sink_;
    }
    if (sink) {
      sink->write(record);
    }
  }

 private:
  const std::string name_;
  std::atomic<LogLevel> level_{LogLevel::Info};
  std::mutex mutex_;
  LogSinkPtr sink_;
};

using LoggerPtr = std::shared_ptr<Logger>;

}  // namespace logging
}  // namespace warden
