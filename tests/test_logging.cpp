// Copyright 2026 The reelcore Authors
// Tests for: reelcore_set_log_level, reelcore_set_log_callback,
//            reelcore_log

#include <cstring>
#include <mutex>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "reelcore/reelcore.h"

// ---------------------------------------------------------------------------
// Helper: capture log messages via callback
// ---------------------------------------------------------------------------

struct LogEntry {
  ReelCoreLogLevel level;
  std::string message;
};

struct LogCapture {
  std::mutex mu;
  std::vector<LogEntry> entries;

  bool Contains(ReelCoreLogLevel level, const std::string& text) {
    std::lock_guard<std::mutex> lock(mu);
    for (const auto& e : entries) {
      if (e.level == level && e.message.find(text) != std::string::npos) {
        return true;
      }
    }
    return false;
  }

  bool Contains(const std::string& text) {
    std::lock_guard<std::mutex> lock(mu);
    for (const auto& e : entries) {
      if (e.message.find(text) != std::string::npos) return true;
    }
    return false;
  }
};

static void TestLogCallback(ReelCoreLogLevel level, const char* message,
                            void* userdata) {
  auto* capture = static_cast<LogCapture*>(userdata);
  std::lock_guard<std::mutex> lock(capture->mu);
  capture->entries.push_back({level, message ? message : ""});
}

class LoggingTest : public ::testing::Test {
 protected:
  void SetUp() override {
    reelcore_set_log_level(kReelCoreLogTrace);
    reelcore_set_log_callback(TestLogCallback, &capture_);
  }

  void TearDown() override {
    reelcore_set_log_callback(nullptr, nullptr);
    reelcore_set_log_level(kReelCoreLogInfo);
  }

  LogCapture capture_;
};

// ---------------------------------------------------------------------------
// Tests
// ---------------------------------------------------------------------------

TEST_F(LoggingTest, SetLogLevelDoesNotCrash) {
  reelcore_set_log_level(kReelCoreLogTrace);
  reelcore_set_log_level(kReelCoreLogDebug);
  reelcore_set_log_level(kReelCoreLogInfo);
  reelcore_set_log_level(kReelCoreLogWarn);
  reelcore_set_log_level(kReelCoreLogError);
  reelcore_set_log_level(kReelCoreLogFatal);
}

TEST_F(LoggingTest, LogCallbackReceivesMessage) {
  reelcore_log(kReelCoreLogInfo, "test message");
  EXPECT_TRUE(capture_.Contains("test message"))
      << "Expected to find 'test message' in log entries";
}

TEST_F(LoggingTest, LogCallbackReceivesCorrectLevel) {
  reelcore_log(kReelCoreLogWarn, "warn msg");
  EXPECT_TRUE(capture_.Contains(kReelCoreLogWarn, "warn msg"));
}

TEST_F(LoggingTest, LogLevelFiltering) {
  reelcore_set_log_level(kReelCoreLogWarn);

  reelcore_log(kReelCoreLogInfo, "should be filtered");
  reelcore_log(kReelCoreLogWarn, "should appear");

  EXPECT_FALSE(capture_.Contains("should be filtered"))
      << "Info message should have been filtered";
  EXPECT_TRUE(capture_.Contains("should appear"))
      << "Warn message should have appeared";
}

TEST_F(LoggingTest, UnregisterCallback) {
  reelcore_set_log_callback(nullptr, nullptr);
  reelcore_log(kReelCoreLogInfo, "after unregister");
  EXPECT_FALSE(capture_.Contains("after unregister"));
}

TEST_F(LoggingTest, LogNullMessage) {
  reelcore_log(kReelCoreLogInfo, nullptr);
}

TEST_F(LoggingTest, LibraryErrorsReachCallback) {
  ReelCoreContext* ctx = reelcore_context_create();
  ASSERT_NE(ctx, nullptr);
  ReelCoreDeliveryRef ref;
  EXPECT_EQ(reelcore_stop_recording(ctx, &ref), kReelCoreErrorNotRecording);
  reelcore_context_destroy(ctx);

  EXPECT_TRUE(capture_.Contains(kReelCoreLogError, "No recording in progress"));
}
