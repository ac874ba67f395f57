// Copyright 2026 The reelcore Authors
// Tests for: reelcore_version_string, reelcore_version_major,
//            reelcore_version_minor, reelcore_version_patch

#include "gtest/gtest.h"
#include "reelcore/reelcore.h"
#include "reelcore/reelcore.hpp"

TEST(VersionTest, VersionStringIsNotNull) {
  const char* ver = reelcore_version_string();
  ASSERT_NE(ver, nullptr);
}

TEST(VersionTest, VersionStringMatchesMacro) {
  EXPECT_STREQ(reelcore_version_string(), REELCORE_VERSION_STRING);
}

TEST(VersionTest, VersionStringMatchesExpected) {
  EXPECT_STREQ(reelcore_version_string(), "1.0.0");
}

TEST(VersionTest, MajorVersion) {
  EXPECT_EQ(reelcore_version_major(), REELCORE_VERSION_MAJOR);
  EXPECT_EQ(reelcore_version_major(), 1);
}

TEST(VersionTest, MinorVersion) {
  EXPECT_EQ(reelcore_version_minor(), REELCORE_VERSION_MINOR);
  EXPECT_EQ(reelcore_version_minor(), 0);
}

TEST(VersionTest, PatchVersion) {
  EXPECT_EQ(reelcore_version_patch(), REELCORE_VERSION_PATCH);
  EXPECT_EQ(reelcore_version_patch(), 0);
}

TEST(VersionTest, CppWrapperAgrees) {
  EXPECT_STREQ(reelcore::version_string(), REELCORE_VERSION_STRING);
}
