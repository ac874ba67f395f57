// Copyright 2026 The reelcore Authors
// Tests for: RecorderConfig defaults, ParseRecorderConfig, LoadRecorderConfig,
//            ParseLogLevel

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

#include "gtest/gtest.h"

#include "core/config.h"
#include "core/logger.h"
#include "fake_backends.h"

using reelcore::internal::DefaultConfigPath;
using reelcore::internal::LoadRecorderConfig;
using reelcore::internal::ParseDeliveryMode;
using reelcore::internal::ParseLogLevel;
using reelcore::internal::ParseRecorderConfig;
using reelcore::internal::RecorderConfig;
using reelcore::test_support::TempDir;

TEST(RecorderConfigTest, Defaults) {
  RecorderConfig config;
  EXPECT_EQ(config.sample_interval_ms, 16);
  EXPECT_EQ(config.cursor_debounce_ms, 100);
  EXPECT_EQ(config.early_failure_frames, 100);
  EXPECT_EQ(config.finalize_size_threshold_bytes, 1024 * 1024);
  EXPECT_EQ(config.finalize_short_timeout_ms, 2000);
  EXPECT_EQ(config.finalize_long_timeout_ms, 8000);
  EXPECT_EQ(config.stop_wait_timeout_ms, 10000);
  EXPECT_EQ(config.delivery_mode, kReelCoreDeliveryServer);
  EXPECT_EQ(config.chunk_size, 1024 * 1024);
  EXPECT_EQ(config.server_host, "127.0.0.1");
  EXPECT_EQ(config.server_port_attempts, 20);
  EXPECT_FALSE(config.allowed_origin.empty());
  EXPECT_FALSE(config.output_dir.empty());
}

TEST(RecorderConfigTest, ParseOverrides) {
  std::istringstream in(
      "# reelcore settings\n"
      "[recording]\n"
      "sample_interval_ms = 8\n"
      "cursor_debounce_ms=50\n"
      "\n"
      "[delivery]\n"
      "delivery_mode = chunked\n"
      "chunk_size = 65536\n"
      "allowed_origin = https://app.example\n"
      "output_dir = /var/tmp/rec\n");
  RecorderConfig config;
  EXPECT_EQ(ParseRecorderConfig(in, &config), 6);
  EXPECT_EQ(config.sample_interval_ms, 8);
  EXPECT_EQ(config.cursor_debounce_ms, 50);
  EXPECT_EQ(config.delivery_mode, kReelCoreDeliveryChunked);
  EXPECT_EQ(config.chunk_size, 65536);
  EXPECT_EQ(config.allowed_origin, "https://app.example");
  EXPECT_EQ(config.output_dir, "/var/tmp/rec");
}

TEST(RecorderConfigTest, BadInputKeepsDefaults) {
  std::istringstream in(
      "no_equals_sign\n"
      "unknown_key = 3\n"
      "sample_interval_ms = fast\n"
      "chunk_size = 0\n"
      "server_base_port = 80x\n"
      "delivery_mode = carrier-pigeon\n"
      "server_host =\n");
  RecorderConfig config;
  EXPECT_EQ(ParseRecorderConfig(in, &config), 0);
  RecorderConfig defaults;
  EXPECT_EQ(config.sample_interval_ms, defaults.sample_interval_ms);
  EXPECT_EQ(config.chunk_size, defaults.chunk_size);
  EXPECT_EQ(config.server_base_port, defaults.server_base_port);
  EXPECT_EQ(config.delivery_mode, defaults.delivery_mode);
  EXPECT_EQ(config.server_host, defaults.server_host);
}

TEST(RecorderConfigTest, StopWaitFollowsLongTimeout) {
  std::istringstream in("finalize_long_timeout_ms = 3000\n");
  RecorderConfig config;
  ParseRecorderConfig(in, &config);
  EXPECT_EQ(config.stop_wait_timeout_ms, 5000);

  std::istringstream explicit_in(
      "finalize_long_timeout_ms = 3000\n"
      "stop_wait_timeout_ms = 4000\n");
  RecorderConfig explicit_config;
  ParseRecorderConfig(explicit_in, &explicit_config);
  EXPECT_EQ(explicit_config.stop_wait_timeout_ms, 4000);
}

TEST(RecorderConfigTest, ValuesPastTheFieldRangeAreRejected) {
  std::istringstream in(
      "finalize_long_timeout_ms = 3000000000\n"
      "sample_interval_ms = -5\n"
      "server_base_port = 70000\n"
      "server_port_attempts = 0\n");
  RecorderConfig config;
  EXPECT_EQ(ParseRecorderConfig(in, &config), 0);
  RecorderConfig defaults;
  EXPECT_EQ(config.finalize_long_timeout_ms, 8000);
  EXPECT_EQ(config.stop_wait_timeout_ms, 10000);
  EXPECT_EQ(config.sample_interval_ms, defaults.sample_interval_ms);
  EXPECT_EQ(config.server_base_port, defaults.server_base_port);
  EXPECT_EQ(config.server_port_attempts, defaults.server_port_attempts);

  std::istringstream edge("server_base_port = 65535\n");
  RecorderConfig edge_config;
  EXPECT_EQ(ParseRecorderConfig(edge, &edge_config), 1);
  EXPECT_EQ(edge_config.server_base_port, 65535);
}

TEST(RecorderConfigTest, DerivedStopWaitSaturates) {
  std::istringstream in("finalize_long_timeout_ms = 2147483000\n");
  RecorderConfig config;
  EXPECT_EQ(ParseRecorderConfig(in, &config), 1);
  EXPECT_EQ(config.finalize_long_timeout_ms, 2147483000);
  EXPECT_EQ(config.stop_wait_timeout_ms, std::numeric_limits<int>::max());
}

TEST(RecorderConfigTest, LogLevelKey) {
  std::istringstream in(
      "log_level = DEBUG\n"
      "log_level = loud\n");
  RecorderConfig config;
  EXPECT_TRUE(config.log_level.empty());
  EXPECT_EQ(ParseRecorderConfig(in, &config), 1);
  EXPECT_EQ(config.log_level, "DEBUG");
}

TEST(RecorderConfigTest, LogLevelNames) {
  ReelCoreLogLevel level = kReelCoreLogInfo;
  EXPECT_TRUE(ParseLogLevel("trace", &level));
  EXPECT_EQ(level, kReelCoreLogTrace);
  EXPECT_TRUE(ParseLogLevel("Warn", &level));
  EXPECT_EQ(level, kReelCoreLogWarn);
  EXPECT_TRUE(ParseLogLevel("FATAL", &level));
  EXPECT_EQ(level, kReelCoreLogFatal);
  EXPECT_FALSE(ParseLogLevel("warning", &level));
  EXPECT_FALSE(ParseLogLevel("", &level));
  EXPECT_EQ(level, kReelCoreLogFatal);
}

TEST(RecorderConfigTest, DeliveryModeNames) {
  ReelCoreDeliveryMode mode = kReelCoreDeliveryServer;
  EXPECT_TRUE(ParseDeliveryMode("whole", &mode));
  EXPECT_EQ(mode, kReelCoreDeliveryWhole);
  EXPECT_TRUE(ParseDeliveryMode("server", &mode));
  EXPECT_EQ(mode, kReelCoreDeliveryServer);
  EXPECT_FALSE(ParseDeliveryMode("Whole", &mode));
  EXPECT_EQ(mode, kReelCoreDeliveryServer);
}

TEST(RecorderConfigTest, LoadMissingFileUsesDefaults) {
  TempDir dir;
  RecorderConfig config;
  EXPECT_TRUE(LoadRecorderConfig(dir.path() + "/nope.ini", &config));
  EXPECT_EQ(config.sample_interval_ms, 16);
}

TEST(RecorderConfigTest, LoadFile) {
  TempDir dir;
  std::string path = dir.path() + "/settings.ini";
  {
    std::ofstream out(path);
    out << "early_failure_frames = 10\nserver_base_port = 20000\n";
  }
  RecorderConfig config;
  ASSERT_TRUE(LoadRecorderConfig(path, &config));
  EXPECT_EQ(config.early_failure_frames, 10);
  EXPECT_EQ(config.server_base_port, 20000);
  EXPECT_FALSE(LoadRecorderConfig(path, nullptr));
}

TEST(RecorderConfigTest, DefaultPathHonorsXdg) {
  const char* saved = std::getenv("XDG_CONFIG_HOME");
  std::string saved_value = saved ? saved : "";

  ::setenv("XDG_CONFIG_HOME", "/opt/cfg", 1);
  EXPECT_EQ(DefaultConfigPath(), "/opt/cfg/reelcore/settings.ini");

  if (saved) {
    ::setenv("XDG_CONFIG_HOME", saved_value.c_str(), 1);
  } else {
    ::unsetenv("XDG_CONFIG_HOME");
  }
}
