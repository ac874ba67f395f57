// Copyright 2026 The reelcore Authors

#ifndef REELCORE_CORE_CALLBACK_SINK_H_
#define REELCORE_CORE_CALLBACK_SINK_H_

#include <mutex>
#include <string>

#include "spdlog/sinks/base_sink.h"

#include "reelcore/reelcore.h"

namespace reelcore {
namespace internal {

/// Forwards log records to the host's reelcore_log_callback_t.
///
/// The host gets the bare message and the level; it does its own
/// decoration.  Records from every library thread pass through here, one at
/// a time under the sink mutex.
class CallbackSink : public spdlog::sinks::base_sink<std::mutex> {
 public:
  /// nullptr `callback` stops forwarding.
  void SetCallback(reelcore_log_callback_t callback, void* userdata) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = callback;
    userdata_ = userdata;
  }

 protected:
  void sink_it_(const spdlog::details::log_msg& msg) override {
    if (!callback_) return;
    std::string text(msg.payload.data(), msg.payload.size());
    callback_(FromSpdlogLevel(msg.level), text.c_str(), userdata_);
  }

  void flush_() override {}

 private:
  static ReelCoreLogLevel FromSpdlogLevel(spdlog::level::level_enum level) {
    switch (level) {
      case spdlog::level::trace: return kReelCoreLogTrace;
      case spdlog::level::debug: return kReelCoreLogDebug;
      case spdlog::level::info:  return kReelCoreLogInfo;
      case spdlog::level::warn:  return kReelCoreLogWarn;
      case spdlog::level::err:   return kReelCoreLogError;
      default:                   return kReelCoreLogFatal;
    }
  }

  reelcore_log_callback_t callback_ = nullptr;
  void* userdata_ = nullptr;
};

}  // namespace internal
}  // namespace reelcore

#endif  // REELCORE_CORE_CALLBACK_SINK_H_
