#include "warden/logging/log_sink.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>

#include <fmt/format.h>

namespace warden {
namespace logging {

LogSink::LogSink() : formatter_(std::make_unique<TextFormatter>()) {}

void LogSink::write(const LogRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  writeLine(record, formatter_->format(record));
}

void LogSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  flushLocked();
}

void LogSink::setFormatter(std::unique_ptr<Formatter> formatter) {
  if (!formatter) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  formatter_ = std::move(formatter);
}

void StdioSink::writeLine(const LogRecord&, const std::string& line) {
  fmt::print(stream_, "{}\n", line);
}

void StdioSink::flushLocked() { std::fflush(stream_); }

FileSink::FileSink(Options options) : options_(std::move(options)) { open(); }

FileSink::~FileSink() {
  if (file_) {
    std::fclose(file_);
  }
}

void FileSink::open() {
  file_ = std::fopen(options_.path.c_str(), "a");
  if (!file_) {
    throw std::runtime_error(fmt::format("cannot open log file {}: {}",
                                         options_.path, std::strerror(errno)));
  }
  std::error_code ec;
  auto existing = std::filesystem::file_size(options_.path, ec);
  size_ = ec ? 0 : static_cast<size_t>(existing);
}

void FileSink::writeLine(const LogRecord&, const std::string& line) {
  if (options_.max_bytes > 0 && size_ > 0 &&
      size_ + line.size() + 1 > options_.max_bytes) {
    rotate();
  }
  if (!file_) {
    return;
  }
  fmt::print(file_, "{}\n", line);
  std::fflush(file_);
  size_ += line.size() + 1;
}

void FileSink::flushLocked() {
  if (file_) {
    std::fflush(file_);
  }
}

void FileSink::rotate() {
  namespace fs = std::filesystem;

  std::fclose(file_);
  file_ = nullptr;

  auto backup = [this](size_t n) {
    return options_.path + "." + std::to_string(n);
  };
  std::error_code ec;
  if (options_.max_backups == 0) {
    fs::remove(options_.path, ec);
  } else {
    fs::remove(backup(options_.max_backups), ec);
    for (size_t n = options_.max_backups; n > 1; --n) {
      fs::rename(backup(n - 1), backup(n), ec);
    }
    fs::rename(options_.path, backup(1), ec);
  }

  // A sink that cannot reopen drops lines rather than throwing into callers
  file_ = std::fopen(options_.path.c_str(), "a");
  size_ = 0;
}

}  // namespace logging
}  // namespace warden
