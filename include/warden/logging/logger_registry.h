#pragma once

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "warden/logging/logger.h"

namespace warden {
namespace logging {

/**
 * @brief Process-wide set of named loggers
 *
 * Every logger writes to the registry's sink. A logger's level is the level
 * of the last matching pattern, or the default level when none matches.
 * Patterns are shell globs over logger names, e.g. "process.*".
 */
class LoggerRegistry {
 public:
  static LoggerRegistry& instance();

  // Created on first use with the current level and sink
  LoggerPtr get(const std::string& name);

  void setLevel(LogLevel level);
  void setLevel(const std::string& pattern, LogLevel level);
  LogLevel level() const;
  LogLevel levelFor(const std::string& name) const;

  void setSink(LogSinkPtr sink);
  LogSinkPtr sink() const;

  std::vector<std::string> names() const;

  // Stderr sink, Info level, no patterns
  void reset();

 private:
  LoggerRegistry();

  LogLevel levelForLocked(const std::string& name) const;
  void refreshLocked();

  mutable std::mutex mutex_;
  std::map<std::string, LoggerPtr> loggers_;
  std::vector<std::pair<std::string, LogLevel>> patterns_;
  LogLevel level_{LogLevel::Info};
  LogSinkPtr sink_;
};

}  // namespace logging
}  // namespace warden
