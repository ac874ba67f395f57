// Copyright 2026 The reelcore Authors

#ifndef REELCORE_CORE_RECORDING_CONTROLLER_H_
#define REELCORE_CORE_RECORDING_CONTROLLER_H_

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/capture_backend.h"
#include "core/capture_worker.h"
#include "core/config.h"
#include "core/display_backend.h"
#include "core/input_backend.h"
#include "core/input_sampler.h"
#include "core/session_context.h"
#include "core/video_encoder.h"
#include "reelcore/reelcore.h"

namespace reelcore {
namespace internal {

/// Frame rate and bitrate for a quality preset.
struct EncoderPreset {
  int fps;
  int bitrate;
};

/// @return false for an unknown quality value.
bool PresetForQuality(ReelCoreQuality quality, EncoderPreset* out_preset);

/// What StopRecording() hands back, selected by `mode`.
struct DeliveryResult {
  ReelCoreDeliveryMode mode = kReelCoreDeliveryWhole;
  std::vector<uint8_t> bytes;  // kReelCoreDeliveryWhole
  int64_t total_chunks = 0;    // kReelCoreDeliveryChunked
  int64_t chunk_size = 0;      // kReelCoreDeliveryChunked
  std::string url;             // kReelCoreDeliveryServer
};

/// Internal implementation of the opaque ReelCoreContext handle.
///
/// Owns the platform backends and the SessionContext, and sequences
/// start / stop / delivery around them.  Command entry points are
/// serialized by one mutex.
class RecordingController {
 public:
  /// Collaborators, injectable for tests.  Any member may be null; the
  /// operations that need it then fail with an error instead of crashing.
  struct Backends {
    std::unique_ptr<DisplayBackend> display;
    std::unique_ptr<CaptureBackend> capture;
    std::unique_ptr<InputBackend> input;
    EncoderFactory encoder_factory;
  };

  /// The backends compiled for this platform.
  static Backends PlatformBackends();

  RecordingController(const RecorderConfig& config, Backends backends);
  ~RecordingController();

  // Non-copyable.
  RecordingController(const RecordingController&) = delete;
  RecordingController& operator=(const RecordingController&) = delete;

  // -- Error state --

  ReelCoreError last_error() const;
  const char* last_error_message() const;

  void SetError(ReelCoreError code, const std::string& message);
  void ClearError();

  // -- Displays --

  int GetDisplayCount();
  ReelCoreError GetDisplayInfo(int display_id, ReelCoreDisplayInfo* out_info);

  // -- Session --

  /// Reclaim leftovers of the previous session and start a new one on
  /// `display_id` (negative: primary display).
  ReelCoreError StartRecording(int display_id, ReelCoreQuality quality);

  /// Stop the running session, wait (bounded) for the encoder to be
  /// finalized and expose the artifact in the configured delivery mode.
  ReelCoreError StopRecording(DeliveryResult* out_result);

  ReelCoreSessionStatus status() const { return session_.status(); }
  bool is_recording() const { return session_.IsActive(); }

  // -- Delivery --

  ReelCoreError GetVideoChunk(int64_t index, std::vector<uint8_t>* out_bytes);
  ReelCoreError GetVideoMetadata(ReelCoreVideoMetadata* out_meta);

  // -- Input samples --

  /// Debounced samples drained at the last stop.
  std::vector<ReelCoreInputSample> LastSamples() const;

  /// Samples of the running session so far, left in place.
  std::vector<ReelCoreInputSample> PeekSamples() { return session_.samples().Peek(); }

  /// How the last stop's finalization ended.  kPartialTimeout when the stop
  /// gave up waiting for the capture worker.
  FinalizeOutcome last_finalize_outcome() const { return finalize_outcome_; }

  const RecorderConfig& config() const { return config_; }
  SessionContext& session() { return session_; }

 private:
  /// Stop whatever the previous session left running and reclaim.
  void TearDownPrevious();

  ReelCoreError ResolveDisplay(int display_id, ReelCoreDisplayInfo* out);
  std::string NextArtifactPath();
  ReelCoreError BuildDelivery(const std::string& path,
                              DeliveryResult* out_result);

  /// Poll `encoding_finished` for at most `timeout`.
  bool WaitEncodingFinished(std::chrono::milliseconds timeout);

  RecorderConfig config_;
  std::unique_ptr<DisplayBackend> display_;
  std::unique_ptr<CaptureBackend> capture_;
  std::unique_ptr<InputBackend> input_;
  EncoderFactory encoder_factory_;

  SessionContext session_;
  std::unique_ptr<InputSampler> sampler_;
  std::unique_ptr<CaptureWorker> worker_;

  // Geometry and timing of the current / last session.
  int width_ = 0;
  int height_ = 0;
  std::chrono::steady_clock::time_point started_at_;

  mutable std::mutex samples_mu_;
  std::vector<ReelCoreInputSample> last_samples_;

  FinalizeOutcome finalize_outcome_ = FinalizeOutcome::kError;

  bool has_metadata_ = false;
  ReelCoreVideoMetadata metadata_ = {};

  std::mutex command_mu_;

  mutable std::mutex error_mu_;
  ReelCoreError last_error_ = kReelCoreOk;
  std::string last_error_message_ = "No error";
};

}  // namespace internal
}  // namespace reelcore

#endif  // REELCORE_CORE_RECORDING_CONTROLLER_H_
