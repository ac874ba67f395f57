// Copyright 2026 The reelcore Authors

#include "core/config.h"

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <limits>
#include <unordered_map>

#include "core/logger.h"

namespace reelcore {
namespace internal {

namespace {

std::string Trim(const std::string& s) {
  size_t begin = s.find_first_not_of(" \t\r");
  if (begin == std::string::npos) return std::string();
  size_t end = s.find_last_not_of(" \t\r");
  return s.substr(begin, end - begin + 1);
}

bool ParseInt64(const std::string& value, int64_t* out) {
  if (value.empty()) return false;
  errno = 0;
  char* end = nullptr;
  long long v = std::strtoll(value.c_str(), &end, 10);
  if (errno != 0 || end == value.c_str() || *end != '\0') return false;
  *out = static_cast<int64_t>(v);
  return true;
}

using Setter = std::function<bool(RecorderConfig*, const std::string&)>;

// Integer field bounded to [min_value, max_value]; max_value never exceeds
// what T holds.
template <typename T>
Setter IntField(T RecorderConfig::*field, int64_t min_value,
                int64_t max_value = std::numeric_limits<T>::max()) {
  max_value = std::min<int64_t>(max_value, std::numeric_limits<T>::max());
  return [field, min_value, max_value](RecorderConfig* c,
                                       const std::string& v) {
    int64_t parsed = 0;
    if (!ParseInt64(v, &parsed) || parsed < min_value || parsed > max_value) {
      return false;
    }
    c->*field = static_cast<T>(parsed);
    return true;
  };
}

Setter StringField(std::string RecorderConfig::*field) {
  return [field](RecorderConfig* c, const std::string& v) {
    if (v.empty()) return false;
    c->*field = v;
    return true;
  };
}

const std::unordered_map<std::string, Setter>& Setters() {
  static const std::unordered_map<std::string, Setter> setters = {
      {"sample_interval_ms", IntField(&RecorderConfig::sample_interval_ms, 1)},
      {"cursor_debounce_ms", IntField(&RecorderConfig::cursor_debounce_ms, 0)},
      {"early_failure_frames",
       IntField(&RecorderConfig::early_failure_frames, 0)},
      {"finalize_size_threshold_bytes",
       IntField(&RecorderConfig::finalize_size_threshold_bytes, 0)},
      {"finalize_short_timeout_ms",
       IntField(&RecorderConfig::finalize_short_timeout_ms, 1)},
      {"finalize_long_timeout_ms",
       IntField(&RecorderConfig::finalize_long_timeout_ms, 1)},
      {"stop_wait_timeout_ms",
       IntField(&RecorderConfig::stop_wait_timeout_ms, 1)},
      {"chunk_size", IntField(&RecorderConfig::chunk_size, 1)},
      {"server_base_port",
       IntField(&RecorderConfig::server_base_port, 1, 65535)},
      {"server_port_attempts",
       IntField(&RecorderConfig::server_port_attempts, 1, 65535)},
      {"map_open_retries", IntField(&RecorderConfig::map_open_retries, 1)},
      {"map_retry_backoff_ms",
       IntField(&RecorderConfig::map_retry_backoff_ms, 0)},
      {"server_host", StringField(&RecorderConfig::server_host)},
      {"allowed_origin", StringField(&RecorderConfig::allowed_origin)},
      {"output_dir", StringField(&RecorderConfig::output_dir)},
      {"log_level",
       [](RecorderConfig* c, const std::string& v) {
         ReelCoreLogLevel level;
         if (!ParseLogLevel(v, &level)) return false;
         c->log_level = v;
         return true;
       }},
      {"delivery_mode",
       [](RecorderConfig* c, const std::string& v) {
         return ParseDeliveryMode(v, &c->delivery_mode);
       }},
  };
  return setters;
}

}  // namespace

std::string RecorderConfig::DefaultAllowedOrigin() {
#ifdef NDEBUG
  return "tauri://localhost";
#else
  return "http://localhost:1420";
#endif
}

std::string RecorderConfig::DefaultOutputDir() {
  const char* tmp = std::getenv("TMPDIR");
  if (tmp && tmp[0]) return tmp;
  return "/tmp";
}

bool ParseDeliveryMode(const std::string& value, ReelCoreDeliveryMode* out) {
  if (value == "whole") {
    *out = kReelCoreDeliveryWhole;
  } else if (value == "chunked") {
    *out = kReelCoreDeliveryChunked;
  } else if (value == "server") {
    *out = kReelCoreDeliveryServer;
  } else {
    return false;
  }
  return true;
}

int ParseRecorderConfig(std::istream& in, RecorderConfig* config) {
  if (!config) return 0;

  bool stop_wait_set = false;
  int applied = 0;
  int line_no = 0;
  std::string line;
  while (std::getline(in, line)) {
    ++line_no;
    line = Trim(line);
    if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[') {
      continue;
    }
    auto eq = line.find('=');
    if (eq == std::string::npos) {
      REELCORE_LOG_WARN("settings:{}: expected key=value", line_no);
      continue;
    }
    std::string key = Trim(line.substr(0, eq));
    std::string val = Trim(line.substr(eq + 1));

    auto it = Setters().find(key);
    if (it == Setters().end()) {
      REELCORE_LOG_WARN("settings:{}: unknown key '{}' ignored", line_no, key);
      continue;
    }
    if (!it->second(config, val)) {
      REELCORE_LOG_WARN("settings:{}: bad value '{}' for '{}', keeping default",
                        line_no, val, key);
      continue;
    }
    if (key == "stop_wait_timeout_ms") stop_wait_set = true;
    ++applied;
  }

  // The stop wait tracks the long finalize deadline unless set explicitly.
  if (!stop_wait_set) {
    int64_t wait = int64_t{config->finalize_long_timeout_ms} + 2000;
    config->stop_wait_timeout_ms = static_cast<int>(
        std::min<int64_t>(wait, std::numeric_limits<int>::max()));
  }
  return applied;
}

bool LoadRecorderConfig(const std::string& path, RecorderConfig* config) {
  if (!config) return false;

  struct stat st;
  if (::stat(path.c_str(), &st) != 0) {
    REELCORE_LOG_DEBUG("No settings file at {}; using defaults", path);
    return true;
  }

  std::ifstream f(path);
  if (!f) {
    REELCORE_LOG_ERROR("Cannot read settings file {}", path);
    return false;
  }
  int applied = ParseRecorderConfig(f, config);
  REELCORE_LOG_INFO("Loaded {} setting(s) from {}", applied, path);
  return true;
}

std::string DefaultConfigPath() {
  std::string base;
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && xdg[0]) {
    base = xdg;
  } else {
    const char* home = std::getenv("HOME");
    base = home ? std::string(home) + "/.config" : std::string("/tmp");
  }
  return base + "/reelcore/settings.ini";
}

}  // namespace internal
}  // namespace reelcore
