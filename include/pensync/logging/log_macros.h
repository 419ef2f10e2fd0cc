#pragma once

#include "pensync/logging/logger_registry.h"

// Component must be defined before using PENSYNC_LOG
#ifndef PENSYNC_LOG_COMPONENT
#define PENSYNC_LOG_COMPONENT "default"
#endif

#ifdef PENSYNC_LOG_DISABLE
#define PENSYNC_LOG(level, ...) ((void)0)
#else
#define PENSYNC_LOG(level, ...)                                          \
  do {                                                                   \
    auto pensync_logger_ =                                               \
        ::pensync::logging::LoggerRegistry::instance().getOrCreateLogger( \
            PENSYNC_LOG_COMPONENT);                                      \
    if (pensync_logger_->shouldLog(::pensync::logging::LogLevel::level)) { \
      pensync_logger_->log(::pensync::logging::LogLevel::level, __FILE__, \
                           __LINE__, __FUNCTION__, __VA_ARGS__);         \
    }                                                                    \
  } while (0)
#endif

#define LOG_DEBUG(...) PENSYNC_LOG(Debug, __VA_ARGS__)
#define LOG_INFO(...) PENSYNC_LOG(Info, __VA_ARGS__)
#define LOG_WARNING(...) PENSYNC_LOG(Warning, __VA_ARGS__)
#define LOG_ERROR(...) PENSYNC_LOG(Error, __VA_ARGS__)
#define LOG_CRITICAL(...) PENSYNC_LOG(Critical, __VA_ARGS__)

// Component logging
#define COMPONENT_LOG(component, level, ...)                            \
  ::pensync::logging::ComponentLogger(                                  \
      ::pensync::logging::Component::component, #component)             \
      .log(::pensync::logging::LogLevel::level, __VA_ARGS__)
