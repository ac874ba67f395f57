// Copyright 2026 The reelcore Authors

#ifndef REELCORE_CORE_CAPTURE_WORKER_H_
#define REELCORE_CORE_CAPTURE_WORKER_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "core/capture_backend.h"
#include "core/finalizer.h"
#include "core/session_context.h"
#include "core/video_encoder.h"

namespace reelcore {
namespace internal {

struct CaptureWorkerConfig {
  /// Encode failures among this many leading frames abort the session.
  int64_t early_failure_frames = 100;
  FinalizerConfig finalizer;
};

/// Per-session frame handler: feeds frames to the encoder, watches the stop
/// flag, and hands the encoder to the Finalizer.
///
/// One instance per session.  Its callbacks run on the capture engine's
/// thread; the finalizer supervisor runs on a thread owned by the worker.
class CaptureWorker : public FrameHandler {
 public:
  /// Throughput counters.  Touched only by the capture thread.
  struct FrameStats {
    int64_t frames_seen = 0;
    int64_t frames_sent = 0;
    int64_t failures = 0;
    double measured_fps = 0.0;

    std::chrono::steady_clock::time_point window_start;
    int64_t window_frames = 0;
  };

  static constexpr std::chrono::seconds kStatsInterval{5};

  CaptureWorker(SessionContext* session, const CaptureWorkerConfig& config);
  ~CaptureWorker() override;

  // Non-copyable.
  CaptureWorker(const CaptureWorker&) = delete;
  CaptureWorker& operator=(const CaptureWorker&) = delete;

  /// Open `encoder` on `config`, place it in the session's encoder slot and
  /// mark the encoder active.
  /// @return kReelCoreErrorEncoderNotAvailable if the encoder cannot open.
  ReelCoreError Prepare(std::unique_ptr<VideoEncoder> encoder,
                        const EncoderConfig& config);

  // FrameHandler.
  void OnFrameArrived(const VideoFrame& frame, CaptureControl* control) override;
  void OnClosed() override;

  /// Stop this worker from touching session-wide state when it closes.
  /// Used when the controller gave up waiting for it.
  void DetachFromSession();

  /// Whether OnClosed() has completed.
  bool closed() const { return closed_.load(); }

  /// Frames accepted by the encoder.
  int64_t frames_encoded() const { return frames_encoded_.load(); }

  /// Valid once closed() is true.
  FinalizeOutcome outcome() const { return outcome_; }
  const ArtifactDescriptor& artifact() const { return finalizer_.artifact(); }

 private:
  /// Take the encoder from the slot and run the Finalizer on the
  /// supervisor thread.
  void BeginFinalization();
  void UpdateStats();

  SessionContext* session_;  // Non-owning.
  CaptureWorkerConfig config_;
  Finalizer finalizer_;
  FinalizeOutcome outcome_ = FinalizeOutcome::kError;

  std::thread finalizer_thread_;
  bool finalizer_launched_ = false;
  bool stop_seen_ = false;

  FrameStats stats_;
  std::atomic<int64_t> frames_encoded_{0};

  std::mutex close_mu_;
  bool detached_ = false;
  std::atomic<bool> closed_{false};
};

}  // namespace internal
}  // namespace reelcore

#endif  // REELCORE_CORE_CAPTURE_WORKER_H_
