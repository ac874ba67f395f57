// Copyright 2026 The reelcore Authors
//
// reelcore_demo -- record a display for a few seconds and report how the
// artifact was delivered.
//
// Usage: reelcore_demo [seconds] [display] [low|medium|high]

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <thread>

#include "reelcore/reelcore.hpp"

namespace {

ReelCoreQuality ParseQuality(const char* s) {
  if (std::strcmp(s, "low") == 0) return kReelCoreQualityLow;
  if (std::strcmp(s, "high") == 0) return kReelCoreQualityHigh;
  return kReelCoreQualityMedium;
}

// Counts warnings and errors; stderr already shows the text.
void CountProblems(ReelCoreLogLevel level, const char*, void* userdata) {
  if (level >= kReelCoreLogWarn) ++*static_cast<std::atomic<int>*>(userdata);
}

}  // namespace

int main(int argc, char** argv) {
  int seconds = argc > 1 ? std::atoi(argv[1]) : 5;
  int display = argc > 2 ? std::atoi(argv[2]) : -1;
  ReelCoreQuality quality =
      argc > 3 ? ParseQuality(argv[3]) : kReelCoreQualityMedium;
  if (seconds <= 0) seconds = 5;

  std::printf("reelcore %s\n", reelcore::version_string());
  std::atomic<int> problems{0};
  reelcore_set_log_callback(&CountProblems, &problems);

  try {
    reelcore::Context ctx;

    auto displays = ctx.GetDisplays();
    for (const auto& d : displays) {
      std::printf("  [%d] %s %dx%d%s\n", d.id, d.name, d.width, d.height,
                  d.is_primary ? " (primary)" : "");
    }

    ctx.StartRecording(display, quality);
    std::printf("Recording for %d s...\n", seconds);
    for (int i = 0; i < seconds; ++i) {
      std::this_thread::sleep_for(std::chrono::seconds(1));
      std::printf("  %d s, %zu cursor samples\n", i + 1,
                  ctx.PeekMousePositions().size());
    }

    reelcore::DeliveryReference ref = ctx.StopRecording();
    ReelCoreVideoMetadata meta = ctx.GetVideoMetadata();
    std::printf("Stopped: %lld bytes, %lld frames, %lld ms, %dx%d\n",
                static_cast<long long>(meta.file_size),
                static_cast<long long>(meta.frame_count),
                static_cast<long long>(meta.duration_ms), meta.width,
                meta.height);
    std::printf("Cursor samples: %zu\n", ctx.GetMousePositions().size());

    switch (ref.mode) {
      case kReelCoreDeliveryWhole:
        std::printf("Delivered %zu bytes in memory\n", ref.bytes.size());
        break;
      case kReelCoreDeliveryChunked:
        std::printf("Delivered as %lld chunks of %lld bytes\n",
                    static_cast<long long>(ref.total_chunks),
                    static_cast<long long>(ref.chunk_size));
        break;
      case kReelCoreDeliveryServer:
        std::printf("Serving at %s -- press Enter to exit\n", ref.url.c_str());
        std::getchar();
        break;
    }
  } catch (const reelcore::Error& e) {
    std::fprintf(stderr, "reelcore error %d: %s\n", static_cast<int>(e.code()),
                 e.what());
    reelcore_set_log_callback(nullptr, nullptr);
    return 1;
  }

  reelcore_set_log_callback(nullptr, nullptr);
  if (problems > 0) std::printf("%d warning(s) logged\n", problems.load());
  return 0;
}
