// Copyright 2026 The reelcore Authors

#include "core/finalizer.h"

#include <future>
#include <thread>
#include <utility>

#include "core/logger.h"
#include "delivery/artifact_reader.h"

namespace reelcore {
namespace internal {

const char* FinalizeOutcomeName(FinalizeOutcome outcome) {
  switch (outcome) {
    case FinalizeOutcome::kCompleted:
      return "completed";
    case FinalizeOutcome::kPartialTimeout:
      return "partial (timeout)";
    case FinalizeOutcome::kError:
      return "error";
  }
  return "unknown";
}

Finalizer::Finalizer(SessionContext* session, const FinalizerConfig& config)
    : session_(session), config_(config) {}

std::chrono::milliseconds Finalizer::DeadlineFor(int64_t current_size) const {
  return current_size > config_.size_threshold_bytes ? config_.short_timeout
                                                     : config_.long_timeout;
}

FinalizeOutcome Finalizer::Finalize(std::unique_ptr<VideoEncoder> encoder,
                                    const std::string& path) {
  artifact_ = ArtifactDescriptor();
  artifact_.path = path;
  int64_t size = ArtifactFileSize(path);
  artifact_.declared_size = size > 0 ? size : 0;

  if (!encoder) {
    REELCORE_LOG_WARN("Finalize: no encoder to finish for {}", path);
    artifact_.ready = true;
    session_->MarkEncodingFinished();
    return FinalizeOutcome::kError;
  }

  const auto deadline = DeadlineFor(artifact_.declared_size);
  REELCORE_LOG_INFO("Finalizing {} ({} bytes, deadline {}ms)", path,
                    artifact_.declared_size, deadline.count());

  // The finish thread owns the encoder; if it is abandoned below, nothing
  // of the session is reachable from it.
  std::shared_ptr<VideoEncoder> owned(std::move(encoder));
  auto done = std::make_shared<std::promise<bool>>();
  std::future<bool> result = done->get_future();

  std::thread finish_thread([owned, done]() {
    bool ok = false;
    try {
      ok = owned->Finish();
    } catch (const std::exception& e) {
      REELCORE_LOG_ERROR("Encoder finish threw: {}", e.what());
    }
    done->set_value(ok);
  });

  FinalizeOutcome outcome;
  if (result.wait_for(deadline) == std::future_status::ready) {
    finish_thread.join();
    outcome = result.get() ? FinalizeOutcome::kCompleted
                           : FinalizeOutcome::kError;
  } else {
    finish_thread.detach();
    outcome = FinalizeOutcome::kPartialTimeout;
  }

  size = ArtifactFileSize(path);
  artifact_.declared_size = size > 0 ? size : 0;
  artifact_.ready = true;
  session_->MarkEncodingFinished();

  switch (outcome) {
    case FinalizeOutcome::kCompleted:
      REELCORE_LOG_INFO("Finalized {} ({} bytes)", path,
                        artifact_.declared_size);
      break;
    case FinalizeOutcome::kPartialTimeout:
      REELCORE_LOG_WARN(
          "Encoder finish exceeded {}ms; abandoning it, using {} bytes on disk",
          deadline.count(), artifact_.declared_size);
      break;
    case FinalizeOutcome::kError:
      REELCORE_LOG_ERROR("Encoder finish failed for {} ({} bytes on disk)",
                         path, artifact_.declared_size);
      break;
  }
  return outcome;
}

}  // namespace internal
}  // namespace reelcore
