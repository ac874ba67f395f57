// Copyright 2026 The reelcore Authors

#include "core/session_context.h"

#include <utility>

#include "core/logger.h"

namespace reelcore {
namespace internal {

constexpr std::chrono::milliseconds SessionContext::kReclaimLockTimeout;

SessionContext::~SessionContext() { Reclaim(); }

bool SessionContext::TransitionStatus(ReelCoreSessionStatus from,
                                      ReelCoreSessionStatus to) {
  return status_.compare_exchange_strong(from, to);
}

bool SessionContext::IsActive() const {
  ReelCoreSessionStatus s = status_.load();
  return s == kReelCoreSessionArmed || s == kReelCoreSessionStopping ||
         s == kReelCoreSessionFinalizing;
}

void SessionContext::BeginSession(const std::string& artifact_path) {
  stop_requested_.store(false);
  encoding_finished_.store(false);
  encoder_active_.store(false);
  {
    std::lock_guard<std::mutex> lock(error_mu_);
    capture_error_.clear();
  }
  std::lock_guard<std::timed_mutex> lock(path_mu_);
  artifact_path_ = artifact_path;
}

std::string SessionContext::artifact_path() const {
  std::lock_guard<std::timed_mutex> lock(path_mu_);
  return artifact_path_;
}

void SessionContext::RecordCaptureError(const std::string& message) {
  std::lock_guard<std::mutex> lock(error_mu_);
  if (capture_error_.empty()) capture_error_ = message;
}

bool SessionContext::has_capture_error() const {
  std::lock_guard<std::mutex> lock(error_mu_);
  return !capture_error_.empty();
}

std::string SessionContext::capture_error() const {
  std::lock_guard<std::mutex> lock(error_mu_);
  return capture_error_;
}

void SessionContext::InstallDelivery(std::unique_ptr<DeliveryState> delivery) {
  std::unique_ptr<DeliveryState> old;
  std::lock_guard<std::timed_mutex> lock(delivery_mu_);
  old = std::move(delivery_);
  old.reset();  // Stop the old server and unmap before publishing.
  delivery_ = std::move(delivery);
}

void SessionContext::Reclaim() {
  stop_requested_.store(false);
  encoder_active_.store(false);

  {
    std::unique_lock<std::timed_mutex> lock(delivery_mu_, std::defer_lock);
    if (lock.try_lock_for(kReclaimLockTimeout)) {
      if (delivery_) {
        if (!delivery_->bound_ports.empty()) {
          REELCORE_LOG_DEBUG("Releasing port {}", delivery_->bound_ports.back());
        }
        delivery_.reset();
      }
    } else {
      REELCORE_LOG_WARN("Reclaim: delivery busy, teardown skipped");
    }
  }

  if (!samples_.TryClear(kReclaimLockTimeout)) {
    REELCORE_LOG_WARN("Reclaim: sample buffer busy, clear skipped");
  }

  {
    std::unique_lock<std::timed_mutex> lock(path_mu_, std::defer_lock);
    if (lock.try_lock_for(kReclaimLockTimeout)) {
      artifact_path_.clear();
    } else {
      REELCORE_LOG_WARN("Reclaim: artifact path busy, clear skipped");
    }
  }

  status_.store(kReelCoreSessionIdle);
  REELCORE_LOG_DEBUG("Session reclaimed");
}

}  // namespace internal
}  // namespace reelcore
