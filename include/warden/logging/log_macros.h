#pragma once

#include "warden/logging/logger_registry.h"

// Each source file names its logger before any include:
//   #define WARDEN_LOG_COMPONENT "process.pool"
#ifndef WARDEN_LOG_COMPONENT
#define WARDEN_LOG_COMPONENT "warden"
#endif

#define WARDEN_LOG_NAMED(name, level, ...)                                   \
  do {                                                                       \
    auto warden_logger_ = ::warden::logging::LoggerRegistry::instance().get( \
        name);                                                               \
    if (warden_logger_->enabled(::warden::logging::LogLevel::level)) {       \
      warden_logger_->log(::warden::logging::LogLevel::level, __FILE__,      \
                          __LINE__, __VA_ARGS__);                            \
    }                                                                        \
  } while (0)

#define WARDEN_LOG(level, ...) \
  WARDEN_LOG_NAMED(WARDEN_LOG_COMPONENT, level, __VA_ARGS__)
