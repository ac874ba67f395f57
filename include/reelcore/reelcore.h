// Copyright 2026 The reelcore Authors
//
// Licensed under the MIT License. See LICENSE file in the project root for
// full license information.

#ifndef REELCORE_REELCORE_H_
#define REELCORE_REELCORE_H_

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ---------------------------------------------------------------------------
// Export macro
// ---------------------------------------------------------------------------
#if defined(_WIN32)
#if defined(REELCORE_BUILDING)
#define REELCORE_API __declspec(dllexport)
#else
#define REELCORE_API __declspec(dllimport)
#endif
#elif defined(__GNUC__) || defined(__clang__)
#define REELCORE_API __attribute__((visibility("default")))
#else
#define REELCORE_API
#endif

// ---------------------------------------------------------------------------
// Version (auto-generated from CMakeLists.txt via configure_file)
// ---------------------------------------------------------------------------
#include "reelcore/version.h"

// ---------------------------------------------------------------------------
// Thread safety
// ---------------------------------------------------------------------------
//
// General rules:
//   - Each ReelCoreContext owns one recording session at a time.  Command
//     entry points (start / stop / chunk access) on the same context are
//     serialized internally and may be called from any thread.
//   - Capture, input sampling, finalization and delivery run on background
//     threads owned by the context.  No callback into user code happens on
//     those threads except the log callback.
//   - reelcore_set_log_level() and reelcore_set_log_callback() are
//     process-global and internally synchronized.
//   - reelcore_version_*() functions are stateless.
//

// ---------------------------------------------------------------------------
// Opaque handles
// ---------------------------------------------------------------------------
typedef struct ReelCoreContext ReelCoreContext;

// ---------------------------------------------------------------------------
// Types
// ---------------------------------------------------------------------------

/// Error codes returned by reelcore functions.
typedef enum ReelCoreError {
  kReelCoreOk = 0,
  kReelCoreErrorNotInitialized = -1,
  kReelCoreErrorInvalidParam = -2,
  kReelCoreErrorNoDisplay = -3,          ///< No displays could be enumerated
  kReelCoreErrorInvalidDisplay = -4,     ///< Display selector out of range
  kReelCoreErrorAlreadyRecording = -5,   ///< A session is still armed
  kReelCoreErrorNotRecording = -6,       ///< Stop requested while idle
  kReelCoreErrorEncoderNotAvailable = -7,
  kReelCoreErrorEncodeFailed = -8,       ///< Early encoding failure aborted the session
  kReelCoreErrorEmptyArtifact = -9,      ///< Artifact missing or zero bytes
  kReelCoreErrorNoAvailablePort = -10,   ///< Range server port range exhausted
  kReelCoreErrorMapFailed = -11,         ///< Memory-mapping the artifact failed
  kReelCoreErrorIo = -12,                ///< Artifact read failed
  kReelCoreErrorOutOfRange = -13,        ///< Chunk index past end of artifact
  kReelCoreErrorNotSupported = -14,      ///< Operation not valid for delivery mode
  kReelCoreErrorOutOfMemory = -15,
  kReelCoreErrorUnknown = -99,
} ReelCoreError;

/// Log severity levels for the internal logging system.
typedef enum ReelCoreLogLevel {
  kReelCoreLogTrace = 0,   ///< Very detailed diagnostic info
  kReelCoreLogDebug = 1,   ///< Debug-level messages
  kReelCoreLogInfo = 2,    ///< Informational messages (default)
  kReelCoreLogWarn = 3,    ///< Warnings
  kReelCoreLogError = 4,   ///< Errors
  kReelCoreLogFatal = 5,   ///< Fatal / critical errors
} ReelCoreLogLevel;

/// User-defined log callback function type.
///
/// @param level  The severity level of the message.
/// @param message  Null-terminated UTF-8 log message.
/// @param userdata  The opaque pointer passed to reelcore_set_log_callback.
typedef void (*reelcore_log_callback_t)(ReelCoreLogLevel level,
                                        const char* message,
                                        void* userdata);

/// Lifecycle of the context's recording session.
typedef enum ReelCoreSessionStatus {
  kReelCoreSessionIdle = 0,
  kReelCoreSessionArmed = 1,       ///< Capture and input sampling running
  kReelCoreSessionStopping = 2,    ///< Stop requested, waiting for frame loop
  kReelCoreSessionFinalizing = 3,  ///< Encoder handed to the finalizer
  kReelCoreSessionDelivering = 4,  ///< Artifact exposed to the caller
} ReelCoreSessionStatus;

/// Encoding presets.
typedef enum ReelCoreQuality {
  kReelCoreQualityLow = 0,     ///< 2.5 Mbps, 30 fps
  kReelCoreQualityMedium = 1,  ///< 5 Mbps, 30 fps (default)
  kReelCoreQualityHigh = 2,    ///< 8 Mbps, 60 fps
} ReelCoreQuality;

/// Classified mouse cursor shape.
typedef enum ReelCoreCursorShape {
  kReelCoreCursorDefault = 0,  ///< Arrow
  kReelCoreCursorText = 1,     ///< I-beam
  kReelCoreCursorPointer = 2,  ///< Hand
  kReelCoreCursorOther = 3,
} ReelCoreCursorShape;

/// How a finished artifact is handed to the caller.
typedef enum ReelCoreDeliveryMode {
  kReelCoreDeliveryWhole = 0,    ///< Entire file returned in memory
  kReelCoreDeliveryChunked = 1,  ///< Pulled with reelcore_get_video_chunk()
  kReelCoreDeliveryServer = 2,   ///< Served over a local range-seekable URL
} ReelCoreDeliveryMode;

/// Information about one display.
typedef struct ReelCoreDisplayInfo {
  int id;            ///< 0-based, in enumeration order
  int x;             ///< Origin in virtual desktop coordinates
  int y;
  int width;
  int height;
  int is_primary;    ///< Non-zero for the primary display
  char name[128];    ///< Display name (UTF-8)
} ReelCoreDisplayInfo;

/// One cursor observation recorded during a session.
typedef struct ReelCoreInputSample {
  int x;                            ///< Relative to the recorded display origin
  int y;
  double timestamp;                 ///< Seconds since the session started
  int is_pressed;                   ///< Non-zero while the primary button is down
  ReelCoreCursorShape cursor_shape;
} ReelCoreInputSample;

/// Result of reelcore_stop_recording().
///
/// Exactly one of the payload groups is meaningful, selected by `mode`.
/// Release with reelcore_delivery_ref_release().
typedef struct ReelCoreDeliveryRef {
  ReelCoreDeliveryMode mode;
  uint8_t* data;           ///< kReelCoreDeliveryWhole: artifact bytes
  size_t size;             ///< kReelCoreDeliveryWhole: byte count
  int64_t total_chunks;    ///< kReelCoreDeliveryChunked
  int64_t chunk_size;      ///< kReelCoreDeliveryChunked
  char url[256];           ///< kReelCoreDeliveryServer: e.g. http://127.0.0.1:17890/
} ReelCoreDeliveryRef;

/// Summary of the last delivered artifact.
typedef struct ReelCoreVideoMetadata {
  int64_t total_chunks;
  int64_t chunk_size;
  int64_t file_size;
  int64_t frame_count;
  int64_t duration_ms;
  int width;
  int height;
} ReelCoreVideoMetadata;

// ---------------------------------------------------------------------------
// Context management
// ---------------------------------------------------------------------------

/// Create a context using the default settings file
/// ($XDG_CONFIG_HOME/reelcore/settings.ini).  A missing file is not an error.
///
/// @return New context, or NULL on failure.  Free with
///         reelcore_context_destroy().
REELCORE_API ReelCoreContext* reelcore_context_create(void);

/// Create a context using an explicit settings file.
///
/// @param config_path  Path to a key=value settings file.  NULL behaves like
///                     reelcore_context_create().
REELCORE_API ReelCoreContext* reelcore_context_create_with_config(
    const char* config_path);

/// Destroy a context.  An active session is stopped and its resources
/// reclaimed.  NULL is safely ignored.
REELCORE_API void reelcore_context_destroy(ReelCoreContext* ctx);

// ---------------------------------------------------------------------------
// Error handling
// ---------------------------------------------------------------------------

/// Get the error code of the most recent failed call on this context.
REELCORE_API ReelCoreError reelcore_get_last_error(const ReelCoreContext* ctx);

/// Get a human-readable message for the most recent error.
/// The returned pointer is valid until the next call on this context.
REELCORE_API const char* reelcore_get_last_error_message(
    const ReelCoreContext* ctx);

// ---------------------------------------------------------------------------
// Displays
// ---------------------------------------------------------------------------

/// Enumerate displays.  Returns the count, or -1 on error.
REELCORE_API int reelcore_get_display_count(ReelCoreContext* ctx);

/// Get information about one display (0-based, enumeration order).
REELCORE_API ReelCoreError reelcore_get_display_info(
    ReelCoreContext* ctx, int display_id, ReelCoreDisplayInfo* out_info);

// ---------------------------------------------------------------------------
// Recording
// ---------------------------------------------------------------------------

/// Start recording a display.
///
/// Any resources left from a previous session (delivery server, mapped
/// artifact, sample buffer) are reclaimed first.
///
/// @param display_id  0-based display index, or a negative value for the
///                    primary display.
/// @param quality     Encoding preset.
/// @return kReelCoreOk, kReelCoreErrorAlreadyRecording if a session is armed,
///         or a configuration / encoder error.
REELCORE_API ReelCoreError reelcore_start_recording(ReelCoreContext* ctx,
                                                    int display_id,
                                                    ReelCoreQuality quality);

/// Stop recording, finalize the artifact and expose it for delivery.
///
/// Blocks until the encoder has been finalized or its deadline has elapsed.
///
/// @param out_ref  Receives the delivery reference.  Release with
///                 reelcore_delivery_ref_release().
REELCORE_API ReelCoreError reelcore_stop_recording(ReelCoreContext* ctx,
                                                   ReelCoreDeliveryRef* out_ref);

/// Release memory owned by a delivery reference.  Safe on a zeroed struct.
REELCORE_API void reelcore_delivery_ref_release(ReelCoreDeliveryRef* ref);

/// Get the current session status.
REELCORE_API ReelCoreSessionStatus reelcore_get_session_status(
    const ReelCoreContext* ctx);

/// Non-zero while a session is armed, stopping or finalizing.
REELCORE_API int reelcore_is_recording(const ReelCoreContext* ctx);

// ---------------------------------------------------------------------------
// Delivery
// ---------------------------------------------------------------------------

/// Read one fixed-size chunk of the last artifact (chunked delivery).
///
/// @param index     0-based chunk index.
/// @param out_data  Receives a malloc'd buffer; free with reelcore_free_buffer().
/// @param out_size  Receives the buffer size.
/// @return kReelCoreErrorOutOfRange once index * chunk_size >= file size.
REELCORE_API ReelCoreError reelcore_get_video_chunk(ReelCoreContext* ctx,
                                                    int64_t index,
                                                    uint8_t** out_data,
                                                    size_t* out_size);

/// Describe the last delivered artifact.
REELCORE_API ReelCoreError reelcore_get_video_metadata(
    ReelCoreContext* ctx, ReelCoreVideoMetadata* out_meta);

/// Free a buffer returned by reelcore_get_video_chunk().
REELCORE_API void reelcore_free_buffer(uint8_t* buffer);

// ---------------------------------------------------------------------------
// Input samples
// ---------------------------------------------------------------------------

/// Copy the cursor samples drained at the last stop (debounced).
///
/// Pass out_samples = NULL and max_count = 0 to query the count.
/// @return Number of samples copied (or available), or -1 on error.
REELCORE_API int reelcore_get_mouse_positions(ReelCoreContext* ctx,
                                              ReelCoreInputSample* out_samples,
                                              int max_count);

/// Copy the samples recorded so far in the running session without removing
/// them.  Same conventions as reelcore_get_mouse_positions().
REELCORE_API int reelcore_peek_mouse_positions(ReelCoreContext* ctx,
                                               ReelCoreInputSample* out_samples,
                                               int max_count);

// ---------------------------------------------------------------------------
// Version information
// ---------------------------------------------------------------------------

REELCORE_API const char* reelcore_version_string(void);
REELCORE_API int reelcore_version_major(void);
REELCORE_API int reelcore_version_minor(void);
REELCORE_API int reelcore_version_patch(void);

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

/// Set the minimum level of messages emitted by the library.
REELCORE_API void reelcore_set_log_level(ReelCoreLogLevel level);

/// Forward log messages to a user callback.  Pass NULL to unregister.
REELCORE_API void reelcore_set_log_callback(reelcore_log_callback_t callback,
                                            void* userdata);

/// Emit a message through the library logger.  NULL is ignored.
REELCORE_API void reelcore_log(ReelCoreLogLevel level, const char* message);

#ifdef __cplusplus
}  // extern "C"
#endif

#endif  // REELCORE_REELCORE_H_
