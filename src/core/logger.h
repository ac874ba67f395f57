// Copyright 2026 The reelcore Authors

#ifndef REELCORE_CORE_LOGGER_H_
#define REELCORE_CORE_LOGGER_H_

#include <memory>
#include <string>

#include "spdlog/spdlog.h"

#include "reelcore/reelcore.h"

namespace reelcore {
namespace internal {

class CallbackSink;

/// Process-wide "reelcore" logger: colored stderr plus the host callback.
/// Created on first use.  The starting level is info, or the value of the
/// REELCORE_LOG_LEVEL environment variable when it names a level.
std::shared_ptr<spdlog::logger> GetLogger();

/// The sink behind reelcore_set_log_callback().
std::shared_ptr<CallbackSink> GetCallbackSink();

void SetLogLevel(ReelCoreLogLevel level);

spdlog::level::level_enum ToSpdlogLevel(ReelCoreLogLevel level);

/// "trace", "debug", "info", "warn", "error" or "fatal" (any case).
bool ParseLogLevel(const std::string& name, ReelCoreLogLevel* out_level);

}  // namespace internal
}  // namespace reelcore

// Internal use only.  Capture, sampler and finalizer threads all log through
// these, so the pattern carries the thread id.
#define REELCORE_LOG_TRACE(...)  SPDLOG_LOGGER_TRACE(::reelcore::internal::GetLogger(), __VA_ARGS__)
#define REELCORE_LOG_DEBUG(...)  SPDLOG_LOGGER_DEBUG(::reelcore::internal::GetLogger(), __VA_ARGS__)
#define REELCORE_LOG_INFO(...)   SPDLOG_LOGGER_INFO(::reelcore::internal::GetLogger(), __VA_ARGS__)
#define REELCORE_LOG_WARN(...)   SPDLOG_LOGGER_WARN(::reelcore::internal::GetLogger(), __VA_ARGS__)
#define REELCORE_LOG_ERROR(...)  SPDLOG_LOGGER_ERROR(::reelcore::internal::GetLogger(), __VA_ARGS__)
#define REELCORE_LOG_FATAL(...)  SPDLOG_LOGGER_CRITICAL(::reelcore::internal::GetLogger(), __VA_ARGS__)

#endif  // REELCORE_CORE_LOGGER_H_
