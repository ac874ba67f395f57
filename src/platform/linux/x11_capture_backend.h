// Copyright 2026 The reelcore Authors

#ifndef REELCORE_PLATFORM_LINUX_X11_CAPTURE_BACKEND_H_
#define REELCORE_PLATFORM_LINUX_X11_CAPTURE_BACKEND_H_

#include <atomic>
#include <memory>
#include <thread>

#include "core/capture_backend.h"
#include "core/video_frame.h"

namespace reelcore {
namespace internal {

/// Linux capture engine: XGetImage of one X screen at a fixed rate on a
/// dedicated thread with its own X connection.
class X11CaptureBackend : public CaptureBackend {
 public:
  X11CaptureBackend();
  ~X11CaptureBackend() override;

  bool Start(const ReelCoreDisplayInfo& display, int fps,
             FrameHandler* handler) override;
  void RequestStop() override;
  void Join() override;
  bool IsRunning() const override { return running_.load(); }

 private:
  /// Lets the frame handler end the loop from inside a callback.
  class LoopControl : public CaptureControl {
   public:
    explicit LoopControl(std::atomic<bool>* stop) : stop_(stop) {}
    void Stop() override { stop_->store(true); }

   private:
    std::atomic<bool>* stop_;
  };

  void Run(void* display, int screen, int width, int height, int fps,
           FrameHandler* handler);

  std::thread thread_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> running_{false};
};

}  // namespace internal
}  // namespace reelcore

#endif  // REELCORE_PLATFORM_LINUX_X11_CAPTURE_BACKEND_H_
