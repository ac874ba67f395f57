// Copyright 2026 The reelcore Authors

#ifndef REELCORE_CORE_CONFIG_H_
#define REELCORE_CORE_CONFIG_H_

#include <cstdint>
#include <istream>
#include <string>

#include "reelcore/reelcore.h"

namespace reelcore {
namespace internal {

/// Tunables for one context.  Every field has a working default; a settings
/// file only needs to name the keys it changes.
struct RecorderConfig {
  // Input sampling.
  int sample_interval_ms = 16;
  int cursor_debounce_ms = 100;

  // Capture worker / finalizer.
  int64_t early_failure_frames = 100;
  int64_t finalize_size_threshold_bytes = 1024 * 1024;
  int finalize_short_timeout_ms = 2000;
  int finalize_long_timeout_ms = 8000;
  int stop_wait_timeout_ms = 10000;  // finalize_long_timeout_ms + 2000

  // Delivery.
  ReelCoreDeliveryMode delivery_mode = kReelCoreDeliveryServer;
  int64_t chunk_size = 1024 * 1024;
  std::string server_host = "127.0.0.1";
  int server_base_port = 17890;
  int server_port_attempts = 20;
  int map_open_retries = 5;
  int map_retry_backoff_ms = 100;
  std::string allowed_origin = DefaultAllowedOrigin();

  // Artifacts.
  std::string output_dir = DefaultOutputDir();

  // Logging.  Empty leaves the process-wide level alone.
  std::string log_level;

  /// "http://localhost:1420" in debug builds, "tauri://localhost" otherwise.
  static std::string DefaultAllowedOrigin();

  /// $TMPDIR, or /tmp.
  static std::string DefaultOutputDir();
};

/// Parse `key=value` lines into `config`.  Blank lines, `#` comments and
/// `[section]` headers are skipped.  Unknown keys and malformed values are
/// logged and leave the default in place.
/// @return Number of keys applied.
int ParseRecorderConfig(std::istream& in, RecorderConfig* config);

/// Load `path` into `config`.  A missing file leaves the defaults and is
/// not an error.
/// @return false only if the file exists but could not be read.
bool LoadRecorderConfig(const std::string& path, RecorderConfig* config);

/// $XDG_CONFIG_HOME/reelcore/settings.ini, falling back to
/// ~/.config/reelcore/settings.ini.
std::string DefaultConfigPath();

/// Parse a delivery mode name ("whole", "chunked", "server").
bool ParseDeliveryMode(const std::string& value, ReelCoreDeliveryMode* out);

}  // namespace internal
}  // namespace reelcore

#endif  // REELCORE_CORE_CONFIG_H_
