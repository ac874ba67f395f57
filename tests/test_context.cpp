// Copyright 2026 The reelcore Authors
// Tests for: reelcore_context_create, reelcore_context_destroy,
//            reelcore_get_last_error, reelcore_get_last_error_message and
//            argument validation of the session / delivery entry points

#include <fstream>
#include <string>

#include "gtest/gtest.h"
#include "reelcore/reelcore.h"

#include "fake_backends.h"

using reelcore::test_support::TempDir;

// ---------------------------------------------------------------------------
// Context lifecycle
// ---------------------------------------------------------------------------

TEST(ContextTest, CreateReturnsNonNull) {
  ReelCoreContext* ctx = reelcore_context_create();
  ASSERT_NE(ctx, nullptr);
  reelcore_context_destroy(ctx);
}

TEST(ContextTest, DestroyNullIsSafe) {
  reelcore_context_destroy(nullptr);
}

TEST(ContextTest, CreateMultipleContexts) {
  ReelCoreContext* a = reelcore_context_create();
  ReelCoreContext* b = reelcore_context_create();
  ASSERT_NE(a, nullptr);
  ASSERT_NE(b, nullptr);
  EXPECT_NE(a, b);
  reelcore_context_destroy(b);
  reelcore_context_destroy(a);
}

TEST(ContextTest, CreateWithConfigFile) {
  TempDir dir;
  std::string path = dir.path() + "/settings.ini";
  {
    std::ofstream out(path);
    out << "[delivery]\ndelivery_mode = chunked\nchunk_size = 2048\n";
  }
  ReelCoreContext* ctx = reelcore_context_create_with_config(path.c_str());
  ASSERT_NE(ctx, nullptr);
  EXPECT_EQ(reelcore_get_last_error(ctx), kReelCoreOk);
  reelcore_context_destroy(ctx);
}

TEST(ContextTest, CreateWithMissingConfigUsesDefaults) {
  TempDir dir;
  std::string path = dir.path() + "/absent.ini";
  ReelCoreContext* ctx = reelcore_context_create_with_config(path.c_str());
  ASSERT_NE(ctx, nullptr);
  reelcore_context_destroy(ctx);
}

// ---------------------------------------------------------------------------
// Error state
// ---------------------------------------------------------------------------

class ContextApiTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ctx_ = reelcore_context_create();
    ASSERT_NE(ctx_, nullptr);
  }
  void TearDown() override { reelcore_context_destroy(ctx_); }

  ReelCoreContext* ctx_ = nullptr;
};

TEST_F(ContextApiTest, InitialErrorIsOk) {
  EXPECT_EQ(reelcore_get_last_error(ctx_), kReelCoreOk);
  EXPECT_NE(reelcore_get_last_error_message(ctx_), nullptr);
}

TEST_F(ContextApiTest, InitialStatusIsIdle) {
  EXPECT_EQ(reelcore_get_session_status(ctx_), kReelCoreSessionIdle);
  EXPECT_EQ(reelcore_is_recording(ctx_), 0);
}

TEST_F(ContextApiTest, StopWhileIdle) {
  ReelCoreDeliveryRef ref;
  EXPECT_EQ(reelcore_stop_recording(ctx_, &ref), kReelCoreErrorNotRecording);
  EXPECT_EQ(reelcore_get_last_error(ctx_), kReelCoreErrorNotRecording);
  EXPECT_EQ(ref.data, nullptr);
  EXPECT_EQ(ref.url[0], '\0');
  EXPECT_EQ(reelcore_get_session_status(ctx_), kReelCoreSessionIdle);
}

TEST_F(ContextApiTest, StopWithNullRef) {
  EXPECT_EQ(reelcore_stop_recording(ctx_, nullptr),
            kReelCoreErrorInvalidParam);
  EXPECT_EQ(reelcore_get_last_error(ctx_), kReelCoreErrorInvalidParam);
}

TEST_F(ContextApiTest, ChunkBeforeAnyRecording) {
  uint8_t* data = nullptr;
  size_t size = 0;
  EXPECT_EQ(reelcore_get_video_chunk(ctx_, 0, &data, &size),
            kReelCoreErrorEmptyArtifact);
  EXPECT_EQ(data, nullptr);
  EXPECT_EQ(size, 0u);
  EXPECT_EQ(reelcore_get_video_chunk(ctx_, 0, nullptr, &size),
            kReelCoreErrorInvalidParam);
}

TEST_F(ContextApiTest, MetadataBeforeAnyRecording) {
  ReelCoreVideoMetadata meta;
  EXPECT_EQ(reelcore_get_video_metadata(ctx_, &meta),
            kReelCoreErrorEmptyArtifact);
  EXPECT_EQ(reelcore_get_video_metadata(ctx_, nullptr),
            kReelCoreErrorInvalidParam);
}

TEST_F(ContextApiTest, MousePositionsEmptyBeforeRecording) {
  EXPECT_EQ(reelcore_get_mouse_positions(ctx_, nullptr, 0), 0);
  EXPECT_EQ(reelcore_peek_mouse_positions(ctx_, nullptr, 0), 0);

  ReelCoreInputSample buf[4];
  EXPECT_EQ(reelcore_get_mouse_positions(ctx_, buf, 4), 0);
}

TEST_F(ContextApiTest, MousePositionsRejectBadBuffer) {
  EXPECT_EQ(reelcore_get_mouse_positions(ctx_, nullptr, 5), -1);
  EXPECT_EQ(reelcore_get_last_error(ctx_), kReelCoreErrorInvalidParam);

  ReelCoreInputSample buf[1];
  EXPECT_EQ(reelcore_peek_mouse_positions(ctx_, buf, -1), -1);
}

TEST_F(ContextApiTest, InvalidQualityIsRejected) {
  EXPECT_EQ(reelcore_start_recording(ctx_, -1,
                                     static_cast<ReelCoreQuality>(99)),
            kReelCoreErrorInvalidParam);
  EXPECT_EQ(reelcore_get_session_status(ctx_), kReelCoreSessionIdle);
}

TEST_F(ContextApiTest, DisplayInfoNullOutput) {
  EXPECT_EQ(reelcore_get_display_info(ctx_, 0, nullptr),
            kReelCoreErrorInvalidParam);
}

TEST(ContextTest, FreeNullBufferIsSafe) {
  reelcore_free_buffer(nullptr);
  reelcore_delivery_ref_release(nullptr);
  ReelCoreDeliveryRef ref = {};
  reelcore_delivery_ref_release(&ref);
}

// ---------------------------------------------------------------------------
// NULL context
// ---------------------------------------------------------------------------

TEST(ContextTest, NullContextIsRejected) {
  ReelCoreDeliveryRef ref;
  uint8_t* data = nullptr;
  size_t size = 0;
  ReelCoreVideoMetadata meta;
  EXPECT_EQ(reelcore_get_last_error(nullptr), kReelCoreErrorInvalidParam);
  EXPECT_NE(reelcore_get_last_error_message(nullptr), nullptr);
  EXPECT_EQ(reelcore_get_display_count(nullptr), -1);
  EXPECT_EQ(reelcore_start_recording(nullptr, -1, kReelCoreQualityMedium),
            kReelCoreErrorInvalidParam);
  EXPECT_EQ(reelcore_stop_recording(nullptr, &ref), kReelCoreErrorInvalidParam);
  EXPECT_EQ(reelcore_get_video_chunk(nullptr, 0, &data, &size),
            kReelCoreErrorInvalidParam);
  EXPECT_EQ(reelcore_get_video_metadata(nullptr, &meta),
            kReelCoreErrorInvalidParam);
  EXPECT_EQ(reelcore_get_mouse_positions(nullptr, nullptr, 0), -1);
  EXPECT_EQ(reelcore_get_session_status(nullptr), kReelCoreSessionIdle);
  EXPECT_EQ(reelcore_is_recording(nullptr), 0);
}
