// Copyright 2026 The reelcore Authors

#ifndef REELCORE_CORE_VIDEO_FRAME_H_
#define REELCORE_CORE_VIDEO_FRAME_H_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace reelcore {
namespace internal {

/// One captured screen frame: BGRA pixels, rows `stride` bytes apart, and
/// the steady-clock instant the capture engine grabbed it.
class VideoFrame {
 public:
  using Clock = std::chrono::steady_clock;

  static constexpr int kBytesPerPixel = 4;

  VideoFrame(int width, int height, int stride, std::vector<uint8_t> pixels,
             Clock::time_point captured_at);

  // Move-only; a 4K frame is 32 MB.
  VideoFrame(const VideoFrame&) = delete;
  VideoFrame& operator=(const VideoFrame&) = delete;
  VideoFrame(VideoFrame&&) = default;
  VideoFrame& operator=(VideoFrame&&) = default;

  /// Black frame stamped with the current time.  nullptr for a
  /// non-positive or oversized geometry.
  static std::unique_ptr<VideoFrame> Allocate(int width, int height);

  /// Take ownership of `pixels`.  nullptr if they cannot hold
  /// `stride * height` bytes.
  static std::unique_ptr<VideoFrame> Adopt(int width, int height, int stride,
                                           std::vector<uint8_t> pixels,
                                           Clock::time_point captured_at);

  int width() const { return width_; }
  int height() const { return height_; }
  int stride() const { return stride_; }
  const uint8_t* data() const { return pixels_.data(); }
  uint8_t* mutable_data() { return pixels_.data(); }
  size_t size_bytes() const { return pixels_.size(); }
  Clock::time_point captured_at() const { return captured_at_; }

 private:
  int width_;
  int height_;
  int stride_;
  std::vector<uint8_t> pixels_;
  Clock::time_point captured_at_;
};

}  // namespace internal
}  // namespace reelcore

#endif  // REELCORE_CORE_VIDEO_FRAME_H_
