// Copyright 2026 The reelcore Authors

#ifndef REELCORE_CORE_CAPTURE_BACKEND_H_
#define REELCORE_CORE_CAPTURE_BACKEND_H_

#include <memory>

#include "core/video_frame.h"
#include "reelcore/reelcore.h"

namespace reelcore {
namespace internal {

/// Handed to FrameHandler callbacks so the handler can end the frame loop
/// from inside the capture thread.
class CaptureControl {
 public:
  virtual ~CaptureControl() = default;

  /// Ask the frame loop to exit after the current callback returns.
  virtual void Stop() = 0;
};

/// Receives frames from a CaptureBackend.  All callbacks run on the capture
/// engine's own thread.
class FrameHandler {
 public:
  virtual ~FrameHandler() = default;

  /// Called for every captured frame.
  virtual void OnFrameArrived(const VideoFrame& frame, CaptureControl* control) = 0;

  /// Called exactly once when the frame loop exits, for any reason
  /// (stop request, display lost, capture error).
  virtual void OnClosed() = 0;
};

/// Abstract interface for the platform frame-capture engine.
///
/// The engine owns its thread.  Only the implementation for the current
/// build platform is compiled.
class CaptureBackend {
 public:
  virtual ~CaptureBackend() = default;

  // Non-copyable.
  CaptureBackend(const CaptureBackend&) = delete;
  CaptureBackend& operator=(const CaptureBackend&) = delete;

  /// Start delivering frames of `display` to `handler` at `fps`.
  /// @return false if the engine could not start; the handler is then never
  ///         called.
  virtual bool Start(const ReelCoreDisplayInfo& display, int fps,
                     FrameHandler* handler) = 0;

  /// Ask the frame loop to exit from outside the capture thread.
  virtual void RequestStop() = 0;

  /// Wait for the capture thread to exit.  No-op if it was never started.
  virtual void Join() = 0;

  /// Whether the frame loop thread is still running.
  virtual bool IsRunning() const = 0;

 protected:
  CaptureBackend() = default;
};

/// Factory function implemented per-platform (one per build target).
/// Defined in platform/<os>/xxx_capture_backend.cpp.
std::unique_ptr<CaptureBackend> CreatePlatformCaptureBackend();

}  // namespace internal
}  // namespace reelcore

#endif  // REELCORE_CORE_CAPTURE_BACKEND_H_
