// Copyright 2026 The reelcore Authors
//
// This file implements all public C API functions declared in reelcore.h.
// It bridges the extern "C" interface to the internal C++ implementation.

#include "reelcore/reelcore.h"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <new>
#include <string>
#include <utility>
#include <vector>

#include "core/callback_sink.h"
#include "core/config.h"
#include "core/logger.h"
#include "core/recording_controller.h"

using reelcore::internal::DeliveryResult;
using reelcore::internal::RecorderConfig;
using reelcore::internal::RecordingController;

// ---------------------------------------------------------------------------
// The opaque ReelCoreContext struct wraps the C++ implementation.
// ---------------------------------------------------------------------------
struct ReelCoreContext {
  std::unique_ptr<RecordingController> impl;
};

namespace {

ReelCoreContext* CreateContext(const std::string& config_path) {
  RecorderConfig config;
  if (!reelcore::internal::LoadRecorderConfig(config_path, &config)) {
    return nullptr;
  }
  ReelCoreLogLevel level;
  if (reelcore::internal::ParseLogLevel(config.log_level, &level)) {
    reelcore::internal::SetLogLevel(level);
  }

  auto* ctx = new (std::nothrow) ReelCoreContext();
  if (!ctx) return nullptr;
  try {
    ctx->impl = std::make_unique<RecordingController>(
        config, RecordingController::PlatformBackends());
  } catch (const std::bad_alloc&) {
    REELCORE_LOG_ERROR("Out of memory creating reelcore context");
    delete ctx;
    return nullptr;
  }
  REELCORE_LOG_INFO("reelcore {} context created", REELCORE_VERSION_STRING);
  return ctx;
}

// Copy `samples` into the caller's array, or report the count when
// out_samples is NULL.
int CopySamples(RecordingController* impl,
                const std::vector<ReelCoreInputSample>& samples,
                ReelCoreInputSample* out_samples, int max_count) {
  if (!out_samples) {
    if (max_count != 0) {
      impl->SetError(kReelCoreErrorInvalidParam,
                     "out_samples is NULL but max_count is non-zero");
      return -1;
    }
    impl->ClearError();
    return static_cast<int>(samples.size());
  }
  if (max_count < 0) {
    impl->SetError(kReelCoreErrorInvalidParam, "max_count is negative");
    return -1;
  }
  size_t n = std::min(samples.size(), static_cast<size_t>(max_count));
  if (n > 0) {
    std::memcpy(out_samples, samples.data(), n * sizeof(ReelCoreInputSample));
  }
  impl->ClearError();
  return static_cast<int>(n);
}

}  // namespace

// ---------------------------------------------------------------------------
// Context management
// ---------------------------------------------------------------------------

ReelCoreContext* reelcore_context_create(void) {
  return CreateContext(reelcore::internal::DefaultConfigPath());
}

ReelCoreContext* reelcore_context_create_with_config(const char* config_path) {
  if (!config_path) return reelcore_context_create();
  return CreateContext(config_path);
}

void reelcore_context_destroy(ReelCoreContext* ctx) {
  delete ctx;
}

// ---------------------------------------------------------------------------
// Error handling
// ---------------------------------------------------------------------------

ReelCoreError reelcore_get_last_error(const ReelCoreContext* ctx) {
  if (!ctx) return kReelCoreErrorInvalidParam;
  return ctx->impl->last_error();
}

const char* reelcore_get_last_error_message(const ReelCoreContext* ctx) {
  if (!ctx) return "Invalid context (NULL)";
  return ctx->impl->last_error_message();
}

// ---------------------------------------------------------------------------
// Displays
// ---------------------------------------------------------------------------

int reelcore_get_display_count(ReelCoreContext* ctx) {
  if (!ctx) return -1;
  return ctx->impl->GetDisplayCount();
}

ReelCoreError reelcore_get_display_info(ReelCoreContext* ctx, int display_id,
                                        ReelCoreDisplayInfo* out_info) {
  if (!ctx) return kReelCoreErrorInvalidParam;
  return ctx->impl->GetDisplayInfo(display_id, out_info);
}

// ---------------------------------------------------------------------------
// Recording
// ---------------------------------------------------------------------------

ReelCoreError reelcore_start_recording(ReelCoreContext* ctx, int display_id,
                                       ReelCoreQuality quality) {
  if (!ctx) return kReelCoreErrorInvalidParam;
  return ctx->impl->StartRecording(display_id, quality);
}

ReelCoreError reelcore_stop_recording(ReelCoreContext* ctx,
                                      ReelCoreDeliveryRef* out_ref) {
  if (!ctx) return kReelCoreErrorInvalidParam;
  if (!out_ref) {
    ctx->impl->SetError(kReelCoreErrorInvalidParam, "out_ref is NULL");
    return kReelCoreErrorInvalidParam;
  }
  std::memset(out_ref, 0, sizeof(*out_ref));

  DeliveryResult result;
  ReelCoreError err = ctx->impl->StopRecording(&result);
  if (err != kReelCoreOk) return err;

  out_ref->mode = result.mode;
  out_ref->total_chunks = result.total_chunks;
  out_ref->chunk_size = result.chunk_size;
  std::strncpy(out_ref->url, result.url.c_str(), sizeof(out_ref->url) - 1);

  if (!result.bytes.empty()) {
    out_ref->data = static_cast<uint8_t*>(std::malloc(result.bytes.size()));
    if (!out_ref->data) {
      ctx->impl->SetError(kReelCoreErrorOutOfMemory,
                          "Failed to allocate artifact buffer");
      return kReelCoreErrorOutOfMemory;
    }
    std::memcpy(out_ref->data, result.bytes.data(), result.bytes.size());
    out_ref->size = result.bytes.size();
  }
  return kReelCoreOk;
}

void reelcore_delivery_ref_release(ReelCoreDeliveryRef* ref) {
  if (!ref) return;
  std::free(ref->data);
  ref->data = nullptr;
  ref->size = 0;
}

ReelCoreSessionStatus reelcore_get_session_status(const ReelCoreContext* ctx) {
  if (!ctx) return kReelCoreSessionIdle;
  return ctx->impl->status();
}

int reelcore_is_recording(const ReelCoreContext* ctx) {
  if (!ctx) return 0;
  return ctx->impl->is_recording() ? 1 : 0;
}

// ---------------------------------------------------------------------------
// Delivery
// ---------------------------------------------------------------------------

ReelCoreError reelcore_get_video_chunk(ReelCoreContext* ctx, int64_t index,
                                       uint8_t** out_data, size_t* out_size) {
  if (!ctx) return kReelCoreErrorInvalidParam;
  if (!out_data || !out_size) {
    ctx->impl->SetError(kReelCoreErrorInvalidParam,
                        "out_data or out_size is NULL");
    return kReelCoreErrorInvalidParam;
  }
  *out_data = nullptr;
  *out_size = 0;

  std::vector<uint8_t> chunk;
  ReelCoreError err = ctx->impl->GetVideoChunk(index, &chunk);
  if (err != kReelCoreOk) return err;

  auto* buf = static_cast<uint8_t*>(std::malloc(chunk.size()));
  if (!buf) {
    ctx->impl->SetError(kReelCoreErrorOutOfMemory,
                        "Failed to allocate chunk buffer");
    return kReelCoreErrorOutOfMemory;
  }
  std::memcpy(buf, chunk.data(), chunk.size());
  *out_data = buf;
  *out_size = chunk.size();
  return kReelCoreOk;
}

ReelCoreError reelcore_get_video_metadata(ReelCoreContext* ctx,
                                          ReelCoreVideoMetadata* out_meta) {
  if (!ctx) return kReelCoreErrorInvalidParam;
  return ctx->impl->GetVideoMetadata(out_meta);
}

void reelcore_free_buffer(uint8_t* buffer) {
  std::free(buffer);
}

// ---------------------------------------------------------------------------
// Input samples
// ---------------------------------------------------------------------------

int reelcore_get_mouse_positions(ReelCoreContext* ctx,
                                 ReelCoreInputSample* out_samples,
                                 int max_count) {
  if (!ctx) return -1;
  return CopySamples(ctx->impl.get(), ctx->impl->LastSamples(), out_samples,
                     max_count);
}

int reelcore_peek_mouse_positions(ReelCoreContext* ctx,
                                  ReelCoreInputSample* out_samples,
                                  int max_count) {
  if (!ctx) return -1;
  return CopySamples(ctx->impl.get(), ctx->impl->PeekSamples(), out_samples,
                     max_count);
}

// ---------------------------------------------------------------------------
// Version information
// ---------------------------------------------------------------------------

const char* reelcore_version_string(void) {
  return REELCORE_VERSION_STRING;
}

int reelcore_version_major(void) { return REELCORE_VERSION_MAJOR; }
int reelcore_version_minor(void) { return REELCORE_VERSION_MINOR; }
int reelcore_version_patch(void) { return REELCORE_VERSION_PATCH; }

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

void reelcore_set_log_level(ReelCoreLogLevel level) {
  reelcore::internal::SetLogLevel(level);
}

void reelcore_set_log_callback(reelcore_log_callback_t callback,
                               void* userdata) {
  auto sink = reelcore::internal::GetCallbackSink();
  if (sink) {
    sink->SetCallback(callback, userdata);
  }
}

void reelcore_log(ReelCoreLogLevel level, const char* message) {
  if (!message) return;
  auto logger = reelcore::internal::GetLogger();
  if (logger) {
    logger->log(reelcore::internal::ToSpdlogLevel(level), "{}", message);
  }
}
