// Copyright 2026 The reelcore Authors

#include "core/capture_worker.h"

#include <string>
#include <utility>

#include "core/logger.h"

namespace reelcore {
namespace internal {

constexpr std::chrono::seconds CaptureWorker::kStatsInterval;

CaptureWorker::CaptureWorker(SessionContext* session,
                             const CaptureWorkerConfig& config)
    : session_(session), config_(config), finalizer_(session, config.finalizer) {}

CaptureWorker::~CaptureWorker() {
  if (finalizer_thread_.joinable()) finalizer_thread_.join();
}

ReelCoreError CaptureWorker::Prepare(std::unique_ptr<VideoEncoder> encoder,
                                     const EncoderConfig& config) {
  if (!encoder) {
    REELCORE_LOG_ERROR("No video encoder available on this platform");
    return kReelCoreErrorEncoderNotAvailable;
  }
  if (!encoder->Open(config)) {
    REELCORE_LOG_ERROR("Failed to open encoder for {} ({}x{} @ {} fps)",
                       config.output_path, config.width, config.height,
                       config.fps);
    return kReelCoreErrorEncoderNotAvailable;
  }

  session_->encoder_slot().Put(std::move(encoder));
  session_->set_encoder_active(true);
  stats_ = FrameStats();
  stats_.window_start = std::chrono::steady_clock::now();

  REELCORE_LOG_INFO("Encoder ready: {} ({}x{} @ {} fps, {} bps)",
                    config.output_path, config.width, config.height,
                    config.fps, config.bitrate);
  return kReelCoreOk;
}

void CaptureWorker::OnFrameArrived(const VideoFrame& frame,
                                   CaptureControl* control) {
  if (stop_seen_) {
    control->Stop();
    return;
  }

  ++stats_.frames_seen;
  bool sent = false;
  bool had_encoder = session_->encoder_slot().WithEncoder(
      [&frame, &sent](VideoEncoder* encoder) {
        sent = encoder->SendFrame(frame);
      });

  if (had_encoder) {
    if (sent) {
      ++stats_.frames_sent;
      frames_encoded_.fetch_add(1);
    } else {
      ++stats_.failures;
      if (stats_.frames_seen <= config_.early_failure_frames) {
        std::string message = "Encoding failed at frame " +
                              std::to_string(stats_.frames_seen) +
                              "; recording aborted";
        REELCORE_LOG_ERROR("{}", message);
        session_->RecordCaptureError(message);
        stop_seen_ = true;
        control->Stop();
        return;
      }
      if (stats_.failures == 1 || stats_.failures % 100 == 0) {
        REELCORE_LOG_WARN("Frame {} failed to encode ({} failures so far)",
                          stats_.frames_seen, stats_.failures);
      }
    }
  }

  UpdateStats();

  if (session_->stop_requested()) {
    stop_seen_ = true;
    BeginFinalization();
    control->Stop();
  }
}

void CaptureWorker::BeginFinalization() {
  std::unique_ptr<VideoEncoder> encoder = session_->encoder_slot().Take();
  if (!encoder) {
    REELCORE_LOG_DEBUG("Stop observed with empty encoder slot");
    session_->MarkEncodingFinished();
    return;
  }

  session_->TransitionStatus(kReelCoreSessionStopping,
                             kReelCoreSessionFinalizing);
  std::string path = session_->artifact_path();
  REELCORE_LOG_INFO("Stop observed after {} frames; finalizing",
                    stats_.frames_sent);

  finalizer_launched_ = true;
  finalizer_thread_ = std::thread(
      [this, path](std::unique_ptr<VideoEncoder> owned) {
        outcome_ = finalizer_.Finalize(std::move(owned), path);
      },
      std::move(encoder));
}

void CaptureWorker::UpdateStats() {
  ++stats_.window_frames;
  auto now = std::chrono::steady_clock::now();
  auto elapsed = now - stats_.window_start;
  if (elapsed < kStatsInterval) return;

  double seconds = std::chrono::duration<double>(elapsed).count();
  stats_.measured_fps = static_cast<double>(stats_.window_frames) / seconds;
  REELCORE_LOG_INFO("Capture: {:.1f} fps, {} frames sent, {} failures",
                    stats_.measured_fps, stats_.frames_sent, stats_.failures);
  stats_.window_start = now;
  stats_.window_frames = 0;
}

void CaptureWorker::OnClosed() {
  if (finalizer_launched_) {
    if (finalizer_thread_.joinable()) finalizer_thread_.join();
  } else {
    // Loop ended without a stop request (early abort, lost display).
    std::unique_ptr<VideoEncoder> leftover = session_->encoder_slot().Take();
    if (leftover) {
      REELCORE_LOG_WARN("Capture loop closed with encoder still open; "
                        "finalizing");
      outcome_ = finalizer_.Finalize(std::move(leftover),
                                     session_->artifact_path());
    }
  }

  session_->set_encoder_active(false);
  session_->MarkEncodingFinished();

  REELCORE_LOG_INFO("Capture closed: {} frames seen, {} sent, {} failures",
                    stats_.frames_seen, stats_.frames_sent, stats_.failures);

  std::lock_guard<std::mutex> lock(close_mu_);
  if (!detached_) session_->Reclaim();
  closed_.store(true);
}

void CaptureWorker::DetachFromSession() {
  std::lock_guard<std::mutex> lock(close_mu_);
  detached_ = true;
}

}  // namespace internal
}  // namespace reelcore
