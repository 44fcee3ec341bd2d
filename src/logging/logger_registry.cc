#include "warden/logging/logger_registry.h"

#include <fnmatch.h>

namespace warden {
namespace logging {

LoggerRegistry& LoggerRegistry::instance() {
  static LoggerRegistry registry;
  return registry;
}

LoggerRegistry::LoggerRegistry() : sink_(std::make_shared<StdioSink>()) {}

LoggerPtr LoggerRegistry::get(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second;
  }

  auto logger = std::make_shared<Logger>(name);
  logger->setLevel(levelForLocked(name));
  logger->setSink(sink_);
  loggers_.emplace(name, logger);
  return logger;
}

void LoggerRegistry::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
  refreshLocked();
}

void LoggerRegistry::setLevel(const std::string& pattern, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  patterns_.emplace_back(pattern, level);
  refreshLocked();
}

LogLevel LoggerRegistry::level() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

LogLevel LoggerRegistry::levelFor(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return levelForLocked(name);
}

void LoggerRegistry::setSink(LogSinkPtr sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = std::move(sink);
  for (auto& entry : loggers_) {
    entry.second->setSink(sink_);
  }
}

LogSinkPtr LoggerRegistry::sink() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sink_;
}

std::vector<std::string> LoggerRegistry::names() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> result;
  for (const auto& entry : loggers_) {
    result.push_back(entry.first);
  }
  return result;
}

void LoggerRegistry::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = LogLevel::Info;
  patterns_.clear();
  sink_ = std::make_shared<StdioSink>();
  for (auto& entry : loggers_) {
    entry.second->setSink(sink_);
  }
  refreshLocked();
}

LogLevel LoggerRegistry::levelForLocked(const std::string& name) const {
  for (auto it = patterns_.rbegin(); it != patterns_.rend(); ++it) {
    if (::fnmatch(it->first.c_str(), name.c_str(), 0) == 0) {
      return it->second;
    }
  }
  return level_;
}

void LoggerRegistry::refreshLocked() {
  for (auto& entry : loggers_) {
    entry.second->setLevel(levelForLocked(entry.first));
  }
}

}  // namespace logging
}  // namespace warden
