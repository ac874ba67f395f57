// Copyright 2026 The reelcore Authors

#include "core/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

#include "spdlog/sinks/stdout_color_sinks.h"

#include "core/callback_sink.h"

namespace reelcore {
namespace internal {

namespace {

struct LoggerState {
  std::shared_ptr<spdlog::logger> logger;
  std::shared_ptr<CallbackSink> callback_sink;
};

LoggerState& State() {
  static std::once_flag once;
  static LoggerState state;
  std::call_once(once, []() {
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    stderr_sink->set_pattern("[reelcore][%l][t%t] %v");
    state.callback_sink = std::make_shared<CallbackSink>();

    state.logger = std::make_shared<spdlog::logger>(
        "reelcore", spdlog::sinks_init_list{stderr_sink, state.callback_sink});

    ReelCoreLogLevel level = kReelCoreLogInfo;
    const char* env = std::getenv("REELCORE_LOG_LEVEL");
    if (env && !ParseLogLevel(env, &level)) level = kReelCoreLogInfo;
    state.logger->set_level(ToSpdlogLevel(level));

    // A hung encoder or a stuck stop must leave its warning on disk.
    state.logger->flush_on(spdlog::level::warn);
  });
  return state;
}

}  // namespace

std::shared_ptr<spdlog::logger> GetLogger() { return State().logger; }

std::shared_ptr<CallbackSink> GetCallbackSink() {
  return State().callback_sink;
}

void SetLogLevel(ReelCoreLogLevel level) {
  State().logger->set_level(ToSpdlogLevel(level));
}

spdlog::level::level_enum ToSpdlogLevel(ReelCoreLogLevel level) {
  switch (level) {
    case kReelCoreLogTrace: return spdlog::level::trace;
    case kReelCoreLogDebug: return spdlog::level::debug;
    case kReelCoreLogInfo:  return spdlog::level::info;
    case kReelCoreLogWarn:  return spdlog::level::warn;
    case kReelCoreLogError: return spdlog::level::err;
    case kReelCoreLogFatal: return spdlog::level::critical;
  }
  return spdlog::level::info;
}

bool ParseLogLevel(const std::string& name, ReelCoreLogLevel* out_level) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  static const struct {
    const char* name;
    ReelCoreLogLevel level;
  } kLevels[] = {
      {"trace", kReelCoreLogTrace}, {"debug", kReelCoreLogDebug},
      {"info", kReelCoreLogInfo},   {"warn", kReelCoreLogWarn},
      {"error", kReelCoreLogError}, {"fatal", kReelCoreLogFatal},
  };
  for (const auto& entry : kLevels) {
    if (lower == entry.name) {
      *out_level = entry.level;
      return true;
    }
  }
  return false;
}

}  // namespace internal
}  // namespace reelcore
