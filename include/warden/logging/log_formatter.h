#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "warden/logging/log_level.h"

namespace warden {
namespace logging {

struct LogRecord {
  LogLevel level{LogLevel::Info};
  std::string logger;
  std::string message;
  // Source location, null when unknown
  const char* file{nullptr};
  int line{0};
  std::chrono::system_clock::time_point time{std::chrono::system_clock::now()};
  std::thread::id thread{std::this_thread::get_id()};
};

class Formatter {
 public:
  virtual ~Formatter() = default;

  // One line, without the trailing newline
  virtual std::string format(const LogRecord& record) const = 0;
};

// 2024-05-01 12:00:00.123 [INFO] [process.pool] [process_pool.cc:42] text
class TextFormatter : public Formatter {
 public:
  std::string format(const LogRecord& record) const override;
};

// {"time":...,"level":...,"logger":...,"message":...}
class JsonFormatter : public Formatter {
 public:
  std::string format(const LogRecord& record) const override;
};

// "default" or "json"; null for anything else
std::unique_ptr<Formatter> createFormatter(const std::string& name);

}  // namespace logging
}  // namespace warden
