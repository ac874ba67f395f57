// Copyright 2026 The reelcore Authors
//
// C++ RAII wrapper for the reelcore C API.
// Header-only; include this file.  Requires C++17 or later.
//
// Usage:
//   #include "reelcore/reelcore.hpp"
//   reelcore::Context ctx;
//   ctx.StartRecording();
//   ...
//   auto ref = ctx.StopRecording();
//   if (ref.mode == kReelCoreDeliveryServer) play(ref.url);

#ifndef REELCORE_REELCORE_HPP_
#define REELCORE_REELCORE_HPP_

#include "reelcore/reelcore.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace reelcore {

// ---------------------------------------------------------------------------
// Exception
// ---------------------------------------------------------------------------

class Error : public std::runtime_error {
 public:
  Error(ReelCoreError code, const char* msg)
      : std::runtime_error(msg ? msg : "reelcore error"), code_(code) {}
  ReelCoreError code() const noexcept { return code_; }

 private:
  ReelCoreError code_;
};

// ---------------------------------------------------------------------------
// DeliveryReference  (owning copy of ReelCoreDeliveryRef)
// ---------------------------------------------------------------------------

struct DeliveryReference {
  ReelCoreDeliveryMode mode = kReelCoreDeliveryWhole;
  std::vector<uint8_t> bytes;    // kReelCoreDeliveryWhole
  int64_t total_chunks = 0;      // kReelCoreDeliveryChunked
  int64_t chunk_size = 0;        // kReelCoreDeliveryChunked
  std::string url;               // kReelCoreDeliveryServer
};

// ---------------------------------------------------------------------------
// Context  (move-only RAII wrapper)
// ---------------------------------------------------------------------------

class Context {
 public:
  Context() : raw_(reelcore_context_create()) {
    if (!raw_) throw Error(kReelCoreErrorNotInitialized, "Context creation failed");
  }
  explicit Context(const std::string& config_path)
      : raw_(reelcore_context_create_with_config(config_path.c_str())) {
    if (!raw_) throw Error(kReelCoreErrorNotInitialized, "Context creation failed");
  }
  ~Context() { reelcore_context_destroy(raw_); }

  Context(Context&& o) noexcept : raw_(o.raw_) { o.raw_ = nullptr; }
  Context& operator=(Context&& o) noexcept {
    if (this != &o) {
      reelcore_context_destroy(raw_);
      raw_ = o.raw_;
      o.raw_ = nullptr;
    }
    return *this;
  }
  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  ReelCoreContext* get() const noexcept { return raw_; }

  ReelCoreError last_error() const {
    return reelcore_get_last_error(raw_);
  }
  const char* last_error_message() const {
    return reelcore_get_last_error_message(raw_);
  }

  // -- Displays --

  std::vector<ReelCoreDisplayInfo> GetDisplays() {
    int n = reelcore_get_display_count(raw_);
    if (n < 0) throw_last("GetDisplays failed");
    std::vector<ReelCoreDisplayInfo> out(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
      check(reelcore_get_display_info(raw_, i, &out[static_cast<size_t>(i)]));
    }
    return out;
  }

  // -- Recording --

  void StartRecording(int display_id = -1,
                      ReelCoreQuality quality = kReelCoreQualityMedium) {
    check(reelcore_start_recording(raw_, display_id, quality));
  }

  DeliveryReference StopRecording() {
    ReelCoreDeliveryRef raw = {};
    check(reelcore_stop_recording(raw_, &raw));

    DeliveryReference ref;
    ref.mode = raw.mode;
    if (raw.data && raw.size > 0) ref.bytes.assign(raw.data, raw.data + raw.size);
    ref.total_chunks = raw.total_chunks;
    ref.chunk_size = raw.chunk_size;
    ref.url = raw.url;
    reelcore_delivery_ref_release(&raw);
    return ref;
  }

  ReelCoreSessionStatus status() const {
    return reelcore_get_session_status(raw_);
  }
  bool is_recording() const { return reelcore_is_recording(raw_) != 0; }

  // -- Delivery --

  std::vector<uint8_t> GetVideoChunk(int64_t index) {
    uint8_t* data = nullptr;
    size_t size = 0;
    check(reelcore_get_video_chunk(raw_, index, &data, &size));
    std::vector<uint8_t> out(data, data + size);
    reelcore_free_buffer(data);
    return out;
  }

  ReelCoreVideoMetadata GetVideoMetadata() {
    ReelCoreVideoMetadata meta = {};
    check(reelcore_get_video_metadata(raw_, &meta));
    return meta;
  }

  // -- Input samples --

  std::vector<ReelCoreInputSample> GetMousePositions() {
    return CopySamples(&reelcore_get_mouse_positions);
  }

  std::vector<ReelCoreInputSample> PeekMousePositions() {
    return CopySamples(&reelcore_peek_mouse_positions);
  }

 private:
  using SampleFn = int (*)(ReelCoreContext*, ReelCoreInputSample*, int);

  std::vector<ReelCoreInputSample> CopySamples(SampleFn fn) {
    int n = fn(raw_, nullptr, 0);
    if (n < 0) throw_last("Sample query failed");
    std::vector<ReelCoreInputSample> buf(static_cast<size_t>(n));
    if (n == 0) return buf;
    int got = fn(raw_, buf.data(), n);
    if (got < 0) throw_last("Sample copy failed");
    buf.resize(static_cast<size_t>(got));
    return buf;
  }

  void check(ReelCoreError err) {
    if (err != kReelCoreOk)
      throw Error(err, reelcore_get_last_error_message(raw_));
  }
  [[noreturn]] void throw_last(const char* fallback) {
    auto err = reelcore_get_last_error(raw_);
    const char* msg = reelcore_get_last_error_message(raw_);
    throw Error(err != kReelCoreOk ? err : kReelCoreErrorUnknown,
                (msg && msg[0]) ? msg : fallback);
  }

  ReelCoreContext* raw_ = nullptr;
};

inline const char* version_string() { return reelcore_version_string(); }

}  // namespace reelcore

#endif  // REELCORE_REELCORE_HPP_
