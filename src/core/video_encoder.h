// Copyright 2026 The reelcore Authors

#ifndef REELCORE_CORE_VIDEO_ENCODER_H_
#define REELCORE_CORE_VIDEO_ENCODER_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "core/video_frame.h"

namespace reelcore {
namespace internal {

/// Parameters for opening an encoder on one output file.
struct EncoderConfig {
  std::string output_path;
  int width = 0;
  int height = 0;
  int fps = 30;
  int bitrate = 5000000;  // 5 Mbps
};

/// Abstract interface for the external video encoder.
///
/// An encoder instance is the session's EncoderHandle: it is owned by exactly
/// one thread at a time and is never shared.  Finish() is blocking and may
/// not return if the underlying pipeline stalls; callers that need a bound
/// must run it on a separate thread (see Finalizer).
///
/// Linux: GStreamer appsrc -> x264enc -> fragmented mp4mux -> filesink
class VideoEncoder {
 public:
  virtual ~VideoEncoder() = default;

  // Non-copyable.
  VideoEncoder(const VideoEncoder&) = delete;
  VideoEncoder& operator=(const VideoEncoder&) = delete;

  /// Create the output file and start the encoding pipeline.
  /// @return true on success.
  virtual bool Open(const EncoderConfig& config) = 0;

  /// Encode one BGRA frame.
  /// @return true if the frame was accepted.
  virtual bool SendFrame(const VideoFrame& frame) = 0;

  /// Flush pending data and finalize the container.
  /// @return true if the output was finalized cleanly.
  virtual bool Finish() = 0;

 protected:
  VideoEncoder() = default;
};

/// Produces a fresh, unopened encoder per session.
using EncoderFactory = std::function<std::unique_ptr<VideoEncoder>()>;

/// Factory function implemented per-platform (one per build target).
/// Defined in platform/<os>/xxx_video_encoder.cpp.
std::unique_ptr<VideoEncoder> CreatePlatformEncoder();

}  // namespace internal
}  // namespace reelcore

#endif  // REELCORE_CORE_VIDEO_ENCODER_H_
