#pragma once

#include <cstdio>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "warden/logging/log_formatter.h"

namespace warden {
namespace logging {

/**
 * @brief Destination for log records
 *
 * write() formats the record with the sink's formatter and hands the line to
 * the subclass under the sink's lock, so subclasses need no locking of
 * their own.
 */
class LogSink {
 public:
  LogSink();
  virtual ~LogSink() = default;

  void write(const LogRecord& record);
  void flush();

  void setFormatter(std::unique_ptr<Formatter> formatter);

 protected:
  virtual void writeLine(const LogRecord& record, const std::string& line) = 0;
  virtual void flushLocked() {}

 private:
  std::mutex mutex_;
  std::unique_ptr<Formatter> formatter_;
};

using LogSinkPtr = std::shared_ptr<LogSink>;

class StdioSink : public LogSink {
 public:
  // stream must outlive the sink; stderr by default
  explicit StdioSink(std::FILE* stream = stderr) : stream_(stream) {}

 protected:
  void writeLine(const LogRecord& record, const std::string& line) override;
  void flushLocked() override;

 private:
  std::FILE* stream_;
};

/**
 * @brief Appends to a file and rotates it by size
 *
 * When the file would grow past max_bytes it is renamed to path.1, older
 * backups shift up by one and anything beyond max_backups is deleted.
 */
class FileSink : public LogSink {
 public:
  struct Options {
    std::string path;
    size_t max_bytes{10 * 1024 * 1024};
    size_t max_backups{5};
  };

  // Throws std::runtime_error if the file cannot be opened
  explicit FileSink(Options options);
  ~FileSink() override;

 protected:
  void writeLine(const LogRecord& record, const std::string& line) override;
  void flushLocked() override;

 private:
  void open();
  void rotate();

  Options options_;
  std::FILE* file_{nullptr};
  size_t size_{0};
};

// Hands each formatted line to a callback
class CallbackSink : public LogSink {
 public:
  using Callback =
      std::function<void(const LogRecord& record, const std::string& line)>;

  explicit CallbackSink(Callback callback) : callback_(std::move(callback)) {}

 protected:
  void writeLine(const LogRecord& record, const std::string& line) override {
    callback_(record, line);
  }

 private:
  Callback callback_;
};

}  // namespace logging
}  // namespace warden
