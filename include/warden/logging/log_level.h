#pragma once

#include <string>

#include "warden/core/compat.h"

namespace warden {
namespace logging {

enum class LogLevel { Debug, Info, Warning, Error, Off };

const char* logLevelName(LogLevel level);

// Case-insensitive; "warn" is accepted for Warning
optional<LogLevel> parseLogLevel(const std::string& name);

}  // namespace logging
}  // namespace warden
