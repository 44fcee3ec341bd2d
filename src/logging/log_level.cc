#include "warden/logging/log_level.h"

#include <strings.h>

namespace warden {
namespace logging {

const char* logLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warning:
      return "WARNING";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Off:
      return "OFF";
  }
  return "UNKNOWN";
}

optional<LogLevel> parseLogLevel(const std::string& name) {
  static const struct {
    const char* name;
    LogLevel level;
  } kNames[] = {{"debug", LogLevel::Debug},     {"info", LogLevel::Info},
                {"warning", LogLevel::Warning}, {"warn", LogLevel::Warning},
                {"error", LogLevel::Error},     {"off", LogLevel::Off}};

  for (const auto& entry : kNames) {
    if (::strcasecmp(name.c_str(), entry.name) == 0) {
      return entry.level;
    }
  }
  return nullopt;
}

}  // namespace logging
}  // namespace warden
