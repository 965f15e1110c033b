#pragma once

#include "relay/logging/logger_registry.h"

// Per-file logger name; define before including this header
#ifndef RELAY_LOG_COMPONENT
#define RELAY_LOG_COMPONENT "relay"
#endif

#ifdef RELAY_LOG_DISABLE
#define RELAY_LOG(level, ...) ((void)0)
#else
#define RELAY_LOG(level, ...)                                          \
  do {                                                                 \
    auto relay_logger_ =                                               \
        ::relay::logging::LoggerRegistry::instance().getOrCreateLogger( \
            RELAY_LOG_COMPONENT);                                      \
    if (relay_logger_->shouldLog(::relay::logging::LogLevel::level)) { \
      relay_logger_->log(::relay::logging::LogLevel::level, __FILE__,  \
                         __LINE__, __FUNCTION__, __VA_ARGS__);         \
    }                                                                  \
  } while (0)
#endif

// Context-aware logging (session / request / direction attached)
#define RELAY_LOG_WITH_CONTEXT(level, context, ...)                       \
  do {                                                                    \
    auto relay_logger_ =                                                  \
        ::relay::logging::LoggerRegistry::instance().getOrCreateLogger(    \
            RELAY_LOG_COMPONENT);                                         \
    if (relay_logger_->shouldLog(::relay::logging::LogLevel::level)) {    \
      relay_logger_->logWithContext(::relay::logging::LogLevel::level,    \
                                    context, __VA_ARGS__);                \
    }                                                                     \
  } while (0)

