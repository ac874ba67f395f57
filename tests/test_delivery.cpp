// Copyright 2026 The reelcore Authors
// Tests for: ReadWholeArtifact, ChunkReader, MappedArtifact, RangeServer

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "httplib.h"

#include "delivery/artifact_reader.h"
#include "delivery/mapped_artifact.h"
#include "delivery/range_server.h"
#include "fake_backends.h"

using reelcore::internal::ArtifactFileSize;
using reelcore::internal::ChunkReader;
using reelcore::internal::MappedArtifact;
using reelcore::internal::RangeServer;
using reelcore::internal::RangeServerConfig;
using reelcore::internal::ReadWholeArtifact;
using reelcore::internal::WaitForAcceptLoop;
using reelcore::test_support::TempDir;

namespace {

constexpr char kOrigin[] = "http://localhost:1420";

/// Listening socket on 127.0.0.1:`port`, closed on destruction.
class PortBlocker {
 public:
  explicit PortBlocker(int port) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ok_ = fd_ >= 0 &&
          ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
          ::listen(fd_, 1) == 0;
  }
  ~PortBlocker() {
    if (fd_ >= 0) ::close(fd_);
  }

  bool ok() const { return ok_; }

 private:
  int fd_ = -1;
  bool ok_ = false;
};

}  // namespace

// ---------------------------------------------------------------------------
// Whole-file reads
// ---------------------------------------------------------------------------

TEST(ArtifactReaderTest, FileSize) {
  TempDir dir;
  EXPECT_EQ(ArtifactFileSize(dir.WriteFile("a.mp4", 777)), 777);
  EXPECT_EQ(ArtifactFileSize(dir.path() + "/missing.mp4"), -1);
  EXPECT_EQ(ArtifactFileSize(dir.path()), -1);  // Directory.
  EXPECT_EQ(ArtifactFileSize(""), -1);
}

TEST(ArtifactReaderTest, ReadWhole) {
  TempDir dir;
  std::string path = dir.WriteFile("a.mp4", 3000);
  std::vector<uint8_t> bytes;
  ASSERT_EQ(ReadWholeArtifact(path, &bytes), kReelCoreOk);
  ASSERT_EQ(bytes.size(), 3000u);
  EXPECT_EQ(bytes[0], 0);
  EXPECT_EQ(bytes[251], 0);
  EXPECT_EQ(bytes[2999], 2999 % 251);
}

TEST(ArtifactReaderTest, ReadWholeMissingOrEmpty) {
  TempDir dir;
  std::vector<uint8_t> bytes;
  EXPECT_EQ(ReadWholeArtifact(dir.path() + "/missing.mp4", &bytes),
            kReelCoreErrorEmptyArtifact);
  EXPECT_EQ(ReadWholeArtifact(dir.WriteFile("empty.mp4", 0), &bytes),
            kReelCoreErrorEmptyArtifact);
  EXPECT_EQ(ReadWholeArtifact(dir.WriteFile("x.mp4", 4), nullptr),
            kReelCoreErrorInvalidParam);
}

// ---------------------------------------------------------------------------
// Chunked access
// ---------------------------------------------------------------------------

TEST(ChunkReaderTest, CoversWholeFile) {
  TempDir dir;
  std::string path = dir.WriteFile("a.mp4", 2500);
  ChunkReader reader(path, 1000);
  ASSERT_EQ(reader.ChunkCount(), 3);

  std::vector<uint8_t> all;
  std::vector<uint8_t> chunk;
  for (int64_t i = 0; i < reader.ChunkCount(); ++i) {
    ASSERT_EQ(reader.GetChunk(i, &chunk), kReelCoreOk);
    all.insert(all.end(), chunk.begin(), chunk.end());
  }
  EXPECT_EQ(chunk.size(), 500u);  // Short tail.

  std::vector<uint8_t> whole;
  ASSERT_EQ(ReadWholeArtifact(path, &whole), kReelCoreOk);
  EXPECT_EQ(all, whole);
}

TEST(ChunkReaderTest, OutOfRange) {
  TempDir dir;
  ChunkReader reader(dir.WriteFile("a.mp4", 2000), 1000);
  std::vector<uint8_t> chunk;
  EXPECT_EQ(reader.ChunkCount(), 2);
  EXPECT_EQ(reader.GetChunk(2, &chunk), kReelCoreErrorOutOfRange);
  EXPECT_EQ(reader.GetChunk(-1, &chunk), kReelCoreErrorOutOfRange);
}

TEST(ChunkReaderTest, HugeIndexIsOutOfRange) {
  TempDir dir;
  ChunkReader reader(dir.WriteFile("a.mp4", 3000), 1024 * 1024);
  std::vector<uint8_t> chunk;
  EXPECT_EQ(reader.GetChunk(int64_t{1} << 44, &chunk),
            kReelCoreErrorOutOfRange);
  EXPECT_EQ(reader.GetChunk(std::numeric_limits<int64_t>::max(), &chunk), kReelCoreErrorOutOfRange);
  EXPECT_TRUE(chunk.empty());
  ASSERT_EQ(reader.GetChunk(0, &chunk), kReelCoreOk);
  EXPECT_EQ(chunk.size(), 3000u);
}

TEST(ChunkReaderTest, MissingFileIsIoError) {
  TempDir dir;
  ChunkReader reader(dir.path() + "/gone.mp4", 1000);
  std::vector<uint8_t> chunk;
  EXPECT_EQ(reader.ChunkCount(), 0);
  EXPECT_EQ(reader.GetChunk(0, &chunk), kReelCoreErrorIo);
}

TEST(ChunkReaderTest, FollowsGrowingFile) {
  TempDir dir;
  std::string path = dir.WriteFile("a.mp4", 1000);
  ChunkReader reader(path, 1000);
  EXPECT_EQ(reader.ChunkCount(), 1);
  dir.WriteFile("a.mp4", 1500);
  EXPECT_EQ(reader.ChunkCount(), 2);
  std::vector<uint8_t> chunk;
  ASSERT_EQ(reader.GetChunk(1, &chunk), kReelCoreOk);
  EXPECT_EQ(chunk.size(), 500u);
}

// ---------------------------------------------------------------------------
// Memory mapping
// ---------------------------------------------------------------------------

TEST(MappedArtifactTest, MapsContents) {
  TempDir dir;
  std::string path = dir.WriteFile("a.mp4", 600);
  ReelCoreError err = kReelCoreErrorUnknown;
  auto mapped = MappedArtifact::Open(path, 1, std::chrono::milliseconds(1),
                                     &err);
  ASSERT_NE(mapped, nullptr);
  EXPECT_EQ(err, kReelCoreOk);
  EXPECT_EQ(mapped->size(), 600u);
  EXPECT_EQ(mapped->data()[300], 300 % 251);
  EXPECT_EQ(mapped->path(), path);
}

TEST(MappedArtifactTest, RetriesUntilFileAppears) {
  TempDir dir;
  std::string path = dir.path() + "/late.mp4";
  std::thread writer([&dir]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    // Renamed into place so the reader never sees a partial file.
    std::string tmp = dir.WriteFile("late.tmp", 100);
    std::rename(tmp.c_str(), (dir.path() + "/late.mp4").c_str());
  });

  ReelCoreError err = kReelCoreErrorUnknown;
  auto mapped = MappedArtifact::Open(path, 20, std::chrono::milliseconds(20),
                                     &err);
  writer.join();
  ASSERT_NE(mapped, nullptr);
  EXPECT_EQ(err, kReelCoreOk);
  EXPECT_EQ(mapped->size(), 100u);
}

TEST(MappedArtifactTest, EmptyFileGivesUp) {
  TempDir dir;
  std::string path = dir.WriteFile("empty.mp4", 0);
  ReelCoreError err = kReelCoreOk;
  auto begin = std::chrono::steady_clock::now();
  auto mapped = MappedArtifact::Open(path, 3, std::chrono::milliseconds(20),
                                     &err);
  auto elapsed = std::chrono::steady_clock::now() - begin;
  EXPECT_EQ(mapped, nullptr);
  EXPECT_EQ(err, kReelCoreErrorEmptyArtifact);
  EXPECT_GE(elapsed, std::chrono::milliseconds(40));
}

// ---------------------------------------------------------------------------
// Range server
// ---------------------------------------------------------------------------

class RangeServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::string path = dir_.WriteFile("video.mp4", 1000);
    ReelCoreError err = kReelCoreErrorUnknown;
    std::unique_ptr<MappedArtifact> mapped =
        MappedArtifact::Open(path, 1, std::chrono::milliseconds(1), &err);
    ASSERT_NE(mapped, nullptr);
    artifact_ = std::shared_ptr<const MappedArtifact>(std::move(mapped));

    config_.host = "127.0.0.1";
    config_.base_port = 39310;
    config_.port_attempts = 10;
    config_.allowed_origin = kOrigin;
  }

  TempDir dir_;
  std::shared_ptr<const MappedArtifact> artifact_;
  RangeServerConfig config_;
};

TEST_F(RangeServerTest, FullGet) {
  RangeServer server(artifact_);
  ASSERT_EQ(server.Start(config_), kReelCoreOk);
  EXPECT_TRUE(server.IsRunning());
  EXPECT_EQ(server.url(),
            "http://127.0.0.1:" + std::to_string(server.port()) + "/");

  httplib::Client client("127.0.0.1", server.port());
  auto res = client.Get("/");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  ASSERT_EQ(res->body.size(), 1000u);
  EXPECT_EQ(static_cast<uint8_t>(res->body[500]), 500 % 251);
  EXPECT_EQ(res->get_header_value("Accept-Ranges"), "bytes");
  EXPECT_EQ(res->get_header_value("Content-Type"), "video/mp4");
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), kOrigin);
}

TEST_F(RangeServerTest, PartialGet) {
  RangeServer server(artifact_);
  ASSERT_EQ(server.Start(config_), kReelCoreOk);

  httplib::Client client("127.0.0.1", server.port());
  auto res = client.Get("/", httplib::Headers{{"Range", "bytes=100-199"}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 206);
  EXPECT_EQ(res->get_header_value("Content-Range"), "bytes 100-199/1000");
  ASSERT_EQ(res->body.size(), 100u);
  EXPECT_EQ(static_cast<uint8_t>(res->body[0]), 100);
  EXPECT_EQ(static_cast<uint8_t>(res->body[99]), 199);
}

TEST_F(RangeServerTest, OpenEndedRange) {
  RangeServer server(artifact_);
  ASSERT_EQ(server.Start(config_), kReelCoreOk);

  httplib::Client client("127.0.0.1", server.port());
  auto res = client.Get("/", httplib::Headers{{"Range", "bytes=900-"}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 206);
  EXPECT_EQ(res->get_header_value("Content-Range"), "bytes 900-999/1000");
  EXPECT_EQ(res->body.size(), 100u);
}

TEST_F(RangeServerTest, PreflightAllowsRange) {
  RangeServer server(artifact_);
  ASSERT_EQ(server.Start(config_), kReelCoreOk);

  httplib::Client client("127.0.0.1", server.port());
  auto res = client.Options("/");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 204);
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), kOrigin);
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Headers"), "Range");
  EXPECT_NE(res->get_header_value("Access-Control-Allow-Methods").find("GET"),
            std::string::npos);
}

TEST_F(RangeServerTest, SecondServerTakesNextPort) {
  RangeServer first(artifact_);
  RangeServer second(artifact_);
  ASSERT_EQ(first.Start(config_), kReelCoreOk);
  ASSERT_EQ(second.Start(config_), kReelCoreOk);
  EXPECT_GT(second.port(), first.port());
  EXPECT_LT(second.port(), config_.base_port + config_.port_attempts);
}

TEST_F(RangeServerTest, ExhaustedPortsAreReported) {
  config_.base_port = 39340;
  config_.port_attempts = 3;
  PortBlocker a(39340);
  PortBlocker b(39341);
  PortBlocker c(39342);
  ASSERT_TRUE(a.ok() && b.ok() && c.ok());

  RangeServer server(artifact_);
  EXPECT_EQ(server.Start(config_), kReelCoreErrorNoAvailablePort);
  EXPECT_FALSE(server.IsRunning());
  EXPECT_EQ(server.port(), -1);
  EXPECT_TRUE(server.url().empty());
}

TEST_F(RangeServerTest, StopReleasesPort) {
  RangeServer server(artifact_);
  ASSERT_EQ(server.Start(config_), kReelCoreOk);
  int port = server.port();
  server.Stop();
  EXPECT_FALSE(server.IsRunning());
  EXPECT_EQ(server.port(), -1);
  server.Stop();  // Idempotent.

  RangeServer again(artifact_);
  ASSERT_EQ(again.Start(config_), kReelCoreOk);
  EXPECT_EQ(again.port(), port);
}

TEST_F(RangeServerTest, PortsPastTheTopAreNotTried) {
  config_.base_port = 65535;
  config_.port_attempts = 5;
  PortBlocker top(65535);
  if (!top.ok()) GTEST_SKIP() << "port 65535 is in use";

  RangeServer server(artifact_);
  EXPECT_EQ(server.Start(config_), kReelCoreErrorNoAvailablePort);
  EXPECT_FALSE(server.IsRunning());
}

TEST(AcceptLoopWaitTest, ReturnsOnceListening) {
  std::atomic<bool> alive{true};
  std::atomic<int> polls{0};
  EXPECT_TRUE(WaitForAcceptLoop([&polls]() { return ++polls >= 3; }, alive,
                                std::chrono::seconds(2)));
  EXPECT_EQ(polls.load(), 3);
}

TEST(AcceptLoopWaitTest, GivesUpWhenLoopAlreadyExited) {
  std::atomic<bool> alive{false};
  auto begin = std::chrono::steady_clock::now();
  EXPECT_FALSE(WaitForAcceptLoop([]() { return false; }, alive,
                                 std::chrono::seconds(10)));
  EXPECT_LT(std::chrono::steady_clock::now() - begin,
            std::chrono::seconds(1));
}

TEST(AcceptLoopWaitTest, GivesUpAtTimeout) {
  std::atomic<bool> alive{true};
  auto begin = std::chrono::steady_clock::now();
  EXPECT_FALSE(WaitForAcceptLoop([]() { return false; }, alive,
                                 std::chrono::milliseconds(50)));
  EXPECT_GE(std::chrono::steady_clock::now() - begin,
            std::chrono::milliseconds(50));
}

TEST_F(RangeServerTest, EmptyArtifactIsRefused) {
  RangeServer server(nullptr);
  EXPECT_EQ(server.Start(config_), kReelCoreErrorEmptyArtifact);
}
