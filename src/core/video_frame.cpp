// Copyright 2026 The reelcore Authors

#include "core/video_frame.h"

#include <utility>

namespace reelcore {
namespace internal {

namespace {

// 8K BGRA is ~127 MB; anything larger is a bogus geometry.
constexpr size_t kMaxFrameBytes = 256ULL * 1024 * 1024;

}  // namespace

constexpr int VideoFrame::kBytesPerPixel;

VideoFrame::VideoFrame(int width, int height, int stride,
                       std::vector<uint8_t> pixels,
                       Clock::time_point captured_at)
    : width_(width),
      height_(height),
      stride_(stride),
      pixels_(std::move(pixels)),
      captured_at_(captured_at) {}

// static
std::unique_ptr<VideoFrame> VideoFrame::Allocate(int width, int height) {
  if (width <= 0 || height <= 0) return nullptr;
  int stride = width * kBytesPerPixel;
  size_t total = static_cast<size_t>(stride) * static_cast<size_t>(height);
  if (total > kMaxFrameBytes) return nullptr;
  return std::make_unique<VideoFrame>(width, height, stride,
                                      std::vector<uint8_t>(total, 0),
                                      Clock::now());
}

// static
std::unique_ptr<VideoFrame> VideoFrame::Adopt(int width, int height,
                                              int stride,
                                              std::vector<uint8_t> pixels,
                                              Clock::time_point captured_at) {
  if (width <= 0 || height <= 0 || stride < width * kBytesPerPixel) {
    return nullptr;
  }
  if (pixels.size() < static_cast<size_t>(stride) * static_cast<size_t>(height)) {
    return nullptr;
  }
  return std::make_unique<VideoFrame>(width, height, stride, std::move(pixels),
                                      captured_at);
}

}  // namespace internal
}  // namespace reelcore
