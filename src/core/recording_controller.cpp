// Copyright 2026 The reelcore Authors

#include "core/recording_controller.h"

#include <sys/stat.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <thread>
#include <utility>

#include "core/logger.h"
#include "delivery/artifact_reader.h"
#include "delivery/delivery_state.h"
#include "delivery/mapped_artifact.h"
#include "delivery/range_server.h"

namespace reelcore {
namespace internal {

namespace {

constexpr auto kStopPollInterval = std::chrono::milliseconds(10);

std::atomic<uint64_t> g_artifact_seq{0};

}  // namespace

bool PresetForQuality(ReelCoreQuality quality, EncoderPreset* out_preset) {
  switch (quality) {
    case kReelCoreQualityLow:
      *out_preset = {30, 2500000};
      return true;
    case kReelCoreQualityMedium:
      *out_preset = {30, 5000000};
      return true;
    case kReelCoreQualityHigh:
      *out_preset = {60, 8000000};
      return true;
  }
  return false;
}

RecordingController::Backends RecordingController::PlatformBackends() {
  Backends backends;
  backends.display = CreatePlatformDisplayBackend();
  backends.capture = CreatePlatformCaptureBackend();
  backends.input = CreatePlatformInputBackend();
  backends.encoder_factory = &CreatePlatformEncoder;
  return backends;
}

RecordingController::RecordingController(const RecorderConfig& config,
                                         Backends backends)
    : config_(config),
      display_(std::move(backends.display)),
      capture_(std::move(backends.capture)),
      input_(std::move(backends.input)),
      encoder_factory_(std::move(backends.encoder_factory)) {
  if (input_) {
    sampler_ = std::make_unique<InputSampler>(
        input_.get(), &session_.samples(),
        std::chrono::milliseconds(config_.sample_interval_ms));
  } else {
    REELCORE_LOG_WARN("No input backend; cursor samples disabled");
  }
  REELCORE_LOG_DEBUG("Recording controller created (delivery mode {})",
                     static_cast<int>(config_.delivery_mode));
}

RecordingController::~RecordingController() {
  std::lock_guard<std::mutex> lock(command_mu_);
  TearDownPrevious();
}

// ---------------------------------------------------------------------------
// Error state
// ---------------------------------------------------------------------------

ReelCoreError RecordingController::last_error() const {
  std::lock_guard<std::mutex> lock(error_mu_);
  return last_error_;
}

const char* RecordingController::last_error_message() const {
  std::lock_guard<std::mutex> lock(error_mu_);
  return last_error_message_.c_str();
}

void RecordingController::SetError(ReelCoreError code,
                                   const std::string& message) {
  std::lock_guard<std::mutex> lock(error_mu_);
  last_error_ = code;
  last_error_message_ = message;
  REELCORE_LOG_ERROR("Error {}: {}", static_cast<int>(code), message);
}

void RecordingController::ClearError() {
  std::lock_guard<std::mutex> lock(error_mu_);
  last_error_ = kReelCoreOk;
  last_error_message_ = "No error";
}

// ---------------------------------------------------------------------------
// Displays
// ---------------------------------------------------------------------------

int RecordingController::GetDisplayCount() {
  if (!display_) {
    SetError(kReelCoreErrorNotSupported, "No display backend on this platform");
    return -1;
  }
  auto displays = display_->ListDisplays();
  ClearError();
  return static_cast<int>(displays.size());
}

ReelCoreError RecordingController::GetDisplayInfo(
    int display_id, ReelCoreDisplayInfo* out_info) {
  if (!out_info) {
    SetError(kReelCoreErrorInvalidParam, "out_info is NULL");
    return kReelCoreErrorInvalidParam;
  }
  if (!display_) {
    SetError(kReelCoreErrorNotSupported, "No display backend on this platform");
    return kReelCoreErrorNotSupported;
  }

  auto displays = display_->ListDisplays();
  if (display_id < 0 || display_id >= static_cast<int>(displays.size())) {
    SetError(kReelCoreErrorInvalidDisplay, "Display index out of range");
    return kReelCoreErrorInvalidDisplay;
  }
  *out_info = displays[static_cast<size_t>(display_id)];
  ClearError();
  return kReelCoreOk;
}

ReelCoreError RecordingController::ResolveDisplay(int display_id,
                                                  ReelCoreDisplayInfo* out) {
  if (!display_) return kReelCoreErrorNotSupported;
  auto displays = display_->ListDisplays();
  if (displays.empty()) return kReelCoreErrorNoDisplay;

  if (display_id < 0) {
    *out = displays.front();
    for (const auto& d : displays) {
      if (d.is_primary) {
        *out = d;
        break;
      }
    }
    return kReelCoreOk;
  }
  if (display_id >= static_cast<int>(displays.size())) {
    return kReelCoreErrorInvalidDisplay;
  }
  *out = displays[static_cast<size_t>(display_id)];
  return kReelCoreOk;
}

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------

void RecordingController::TearDownPrevious() {
  if (capture_) {
    capture_->RequestStop();
    capture_->Join();
  }
  if (sampler_) sampler_->Stop();
  worker_.reset();
  session_.Reclaim();
}

std::string RecordingController::NextArtifactPath() {
  const std::string& dir = config_.output_dir;
  if (::mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
    REELCORE_LOG_WARN("Cannot create output dir {}: {}", dir,
                      std::strerror(errno));
  }
  auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
  uint64_t seq = g_artifact_seq.fetch_add(1);
  return dir + "/reelcore-" + std::to_string(epoch_ms) + "-" +
         std::to_string(seq) + ".mp4";
}

ReelCoreError RecordingController::StartRecording(int display_id,
                                                  ReelCoreQuality quality) {
  std::lock_guard<std::mutex> lock(command_mu_);

  if (session_.status() == kReelCoreSessionArmed && capture_ &&
      capture_->IsRunning()) {
    SetError(kReelCoreErrorAlreadyRecording, "A recording is already running");
    return kReelCoreErrorAlreadyRecording;
  }

  TearDownPrevious();

  EncoderPreset preset;
  if (!PresetForQuality(quality, &preset)) {
    SetError(kReelCoreErrorInvalidParam, "Unknown quality preset");
    return kReelCoreErrorInvalidParam;
  }
  if (!capture_) {
    SetError(kReelCoreErrorNotSupported, "No capture backend on this platform");
    return kReelCoreErrorNotSupported;
  }

  ReelCoreDisplayInfo display = {};
  ReelCoreError err = ResolveDisplay(display_id, &display);
  if (err != kReelCoreOk) {
    SetError(err, err == kReelCoreErrorInvalidDisplay
                      ? "Display " + std::to_string(display_id) + " not found"
                      : std::string("No displays available"));
    return err;
  }

  // H.264 needs even dimensions.
  display.width &= ~1;
  display.height &= ~1;
  if (display.width < 2 || display.height < 2) {
    SetError(kReelCoreErrorInvalidDisplay, "Display too small to record");
    return kReelCoreErrorInvalidDisplay;
  }

  EncoderConfig encoder_config;
  encoder_config.output_path = NextArtifactPath();
  encoder_config.width = display.width;
  encoder_config.height = display.height;
  encoder_config.fps = preset.fps;
  encoder_config.bitrate = preset.bitrate;

  session_.BeginSession(encoder_config.output_path);

  CaptureWorkerConfig worker_config;
  worker_config.early_failure_frames = config_.early_failure_frames;
  worker_config.finalizer.size_threshold_bytes =
      config_.finalize_size_threshold_bytes;
  worker_config.finalizer.short_timeout =
      std::chrono::milliseconds(config_.finalize_short_timeout_ms);
  worker_config.finalizer.long_timeout =
      std::chrono::milliseconds(config_.finalize_long_timeout_ms);

  auto worker = std::make_unique<CaptureWorker>(&session_, worker_config);
  err = worker->Prepare(encoder_factory_ ? encoder_factory_() : nullptr,
                        encoder_config);
  if (err != kReelCoreOk) {
    session_.Reclaim();
    SetError(err, "Video encoder could not be opened");
    return err;
  }
  worker_ = std::move(worker);

  {
    std::lock_guard<std::mutex> samples_lock(samples_mu_);
    last_samples_.clear();
  }
  has_metadata_ = false;
  metadata_ = ReelCoreVideoMetadata();
  width_ = display.width;
  height_ = display.height;
  started_at_ = std::chrono::steady_clock::now();

  session_.set_status(kReelCoreSessionArmed);

  if (!capture_->Start(display, preset.fps, worker_.get())) {
    // The handler never ran, so the encoder is still in the slot.
    session_.encoder_slot().Take().reset();
    session_.Reclaim();
    worker_.reset();
    SetError(kReelCoreErrorNoDisplay, "Capture engine failed to start");
    return kReelCoreErrorNoDisplay;
  }

  if (sampler_) {
    sampler_->Start(display, started_at_, [this]() {
      ReelCoreSessionStatus s = session_.status();
      return s == kReelCoreSessionArmed || s == kReelCoreSessionStopping;
    });
  }

  REELCORE_LOG_INFO("Recording display {} ({}x{} @ {} fps) to {}", display.id,
                    display.width, display.height, preset.fps,
                    encoder_config.output_path);
  ClearError();
  return kReelCoreOk;
}

bool RecordingController::WaitEncodingFinished(
    std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!session_.encoding_finished()) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(kStopPollInterval);
  }
  return true;
}

ReelCoreError RecordingController::StopRecording(DeliveryResult* out_result) {
  if (!out_result) {
    SetError(kReelCoreErrorInvalidParam, "out_ref is NULL");
    return kReelCoreErrorInvalidParam;
  }

  std::lock_guard<std::mutex> lock(command_mu_);

  if (session_.status() != kReelCoreSessionArmed) {
    bool aborted = session_.has_capture_error();
    std::string reason = session_.capture_error();
    if (sampler_) sampler_->Stop();
    session_.Reclaim();
    if (aborted) {
      SetError(kReelCoreErrorEncodeFailed, reason);
      return kReelCoreErrorEncodeFailed;
    }
    SetError(kReelCoreErrorNotRecording, "No recording in progress");
    return kReelCoreErrorNotRecording;
  }

  session_.set_status(kReelCoreSessionStopping);
  const std::string path = session_.artifact_path();
  auto duration = std::chrono::steady_clock::now() - started_at_;

  // Samples first, so the buffer is drained before the worker's reclaim.
  if (sampler_) sampler_->Stop();
  std::vector<ReelCoreInputSample> samples = session_.samples().Drain();
  DebounceCursorShapes(&samples, config_.cursor_debounce_ms / 1000.0);
  REELCORE_LOG_INFO("Drained {} cursor samples", samples.size());
  {
    std::lock_guard<std::mutex> samples_lock(samples_mu_);
    last_samples_ = std::move(samples);
  }

  session_.RequestStop();
  bool worker_closed = false;
  if (WaitEncodingFinished(
          std::chrono::milliseconds(config_.stop_wait_timeout_ms))) {
    capture_->Join();
    worker_closed = worker_ && worker_->closed();
  } else {
    REELCORE_LOG_WARN("Capture worker did not finish within {}ms; detaching",
                      config_.stop_wait_timeout_ms);
    if (worker_) worker_->DetachFromSession();
    capture_->RequestStop();
  }

  if (session_.has_capture_error()) {
    std::string reason = session_.capture_error();
    session_.Reclaim();
    SetError(kReelCoreErrorEncodeFailed, reason);
    return kReelCoreErrorEncodeFailed;
  }

  // A detached worker is still running; its finalizer result is not ours to
  // read yet.
  finalize_outcome_ = worker_closed ? worker_->outcome()
                                    : FinalizeOutcome::kPartialTimeout;
  if (worker_closed && worker_->artifact().ready) {
    REELCORE_LOG_INFO("Finalize {}: {} bytes on disk when it began",
                      FinalizeOutcomeName(finalize_outcome_),
                      worker_->artifact().declared_size);
  }

  int64_t size = ArtifactFileSize(path);
  if (size <= 0) {
    session_.Reclaim();
    SetError(kReelCoreErrorEmptyArtifact,
             "Recording produced no data: " + path);
    return kReelCoreErrorEmptyArtifact;
  }

  session_.set_status(kReelCoreSessionDelivering);
  *out_result = DeliveryResult();
  ReelCoreError err = BuildDelivery(path, out_result);
  if (err != kReelCoreOk) {
    session_.Reclaim();
    SetError(err, "Failed to deliver " + path);
    return err;
  }

  metadata_ = ReelCoreVideoMetadata();
  metadata_.file_size = size;
  metadata_.chunk_size = config_.chunk_size;
  metadata_.total_chunks = (size + config_.chunk_size - 1) / config_.chunk_size;
  metadata_.frame_count = worker_ ? worker_->frames_encoded() : 0;
  metadata_.duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
  metadata_.width = width_;
  metadata_.height = height_;
  has_metadata_ = true;

  REELCORE_LOG_INFO("Recording stopped: {} ({} bytes, {} frames, {}ms, {})",
                    path, size, metadata_.frame_count, metadata_.duration_ms,
                    worker_closed ? FinalizeOutcomeName(finalize_outcome_)
                                  : "worker detached");
  ClearError();
  return kReelCoreOk;
}

ReelCoreError RecordingController::BuildDelivery(const std::string& path,
                                                 DeliveryResult* out_result) {
  auto state = std::make_unique<DeliveryState>();
  state->mode = config_.delivery_mode;
  state->path = path;
  // Chunk access works in every mode.
  state->chunks = std::make_unique<ChunkReader>(path, config_.chunk_size);

  out_result->mode = config_.delivery_mode;
  out_result->chunk_size = config_.chunk_size;
  out_result->total_chunks = state->chunks->ChunkCount();

  switch (config_.delivery_mode) {
    case kReelCoreDeliveryWhole: {
      ReelCoreError err = ReadWholeArtifact(path, &out_result->bytes);
      if (err != kReelCoreOk) return err;
      break;
    }
    case kReelCoreDeliveryChunked:
      break;
    case kReelCoreDeliveryServer: {
      // The previous server must release its port before probing starts.
      session_.InstallDelivery(nullptr);

      ReelCoreError err = kReelCoreOk;
      std::unique_ptr<MappedArtifact> mapped = MappedArtifact::Open(
          path, config_.map_open_retries,
          std::chrono::milliseconds(config_.map_retry_backoff_ms), &err);
      if (!mapped) return err;
      state->mapped = std::shared_ptr<const MappedArtifact>(std::move(mapped));

      RangeServerConfig server_config;
      server_config.host = config_.server_host;
      server_config.base_port = config_.server_base_port;
      server_config.port_attempts = config_.server_port_attempts;
      server_config.allowed_origin = config_.allowed_origin;

      state->server = std::make_unique<RangeServer>(state->mapped);
      err = state->server->Start(server_config);
      if (err != kReelCoreOk) return err;
      state->bound_ports.push_back(state->server->port());
      out_result->url = state->server->url();
      break;
    }
  }

  session_.InstallDelivery(std::move(state));
  return kReelCoreOk;
}

// ---------------------------------------------------------------------------
// Delivery
// ---------------------------------------------------------------------------

ReelCoreError RecordingController::GetVideoChunk(
    int64_t index, std::vector<uint8_t>* out_bytes) {
  if (!out_bytes) {
    SetError(kReelCoreErrorInvalidParam, "out_data is NULL");
    return kReelCoreErrorInvalidParam;
  }

  std::lock_guard<std::mutex> lock(command_mu_);
  ReelCoreError err = session_.WithDelivery([&](DeliveryState* delivery) {
    if (!delivery || !delivery->chunks) return kReelCoreErrorEmptyArtifact;
    return delivery->chunks->GetChunk(index, out_bytes);
  });

  if (err == kReelCoreErrorEmptyArtifact) {
    SetError(err, "No delivered recording");
  } else if (err == kReelCoreErrorOutOfRange) {
    SetError(err, "Chunk " + std::to_string(index) + " is past the end");
  } else if (err != kReelCoreOk) {
    SetError(err, "Failed to read chunk " + std::to_string(index));
  } else {
    ClearError();
  }
  return err;
}

ReelCoreError RecordingController::GetVideoMetadata(
    ReelCoreVideoMetadata* out_meta) {
  if (!out_meta) {
    SetError(kReelCoreErrorInvalidParam, "out_meta is NULL");
    return kReelCoreErrorInvalidParam;
  }
  std::lock_guard<std::mutex> lock(command_mu_);
  if (!has_metadata_) {
    SetError(kReelCoreErrorEmptyArtifact, "No delivered recording");
    return kReelCoreErrorEmptyArtifact;
  }
  *out_meta = metadata_;
  ClearError();
  return kReelCoreOk;
}

std::vector<ReelCoreInputSample> RecordingController::LastSamples() const {
  std::lock_guard<std::mutex> lock(samples_mu_);
  return last_samples_;
}

}  // namespace internal
}  // namespace reelcore
