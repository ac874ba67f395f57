// Copyright 2026 The reelcore Authors

#ifndef REELCORE_CORE_FINALIZER_H_
#define REELCORE_CORE_FINALIZER_H_

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "core/session_context.h"
#include "core/video_encoder.h"

namespace reelcore {
namespace internal {

enum class FinalizeOutcome {
  kCompleted,       // Finish() returned true within the deadline
  kPartialTimeout,  // Deadline expired; the finish thread was abandoned
  kError,           // Finish() returned false within the deadline
};

const char* FinalizeOutcomeName(FinalizeOutcome outcome);

/// The artifact as seen by the finalizer.
struct ArtifactDescriptor {
  std::string path;
  int64_t declared_size = 0;  // Bytes on disk when finalization concluded
  bool ready = false;         // Finalization concluded (any outcome)
};

struct FinalizerConfig {
  int64_t size_threshold_bytes = 1024 * 1024;
  std::chrono::milliseconds short_timeout{2000};
  std::chrono::milliseconds long_timeout{8000};
};

/// Bounded-time encoder finish.
///
/// Finish() runs on its own thread which owns the encoder.  If the deadline
/// passes first, that thread is detached and never waited on again; the file
/// already on disk is trusted as the artifact.  An artifact already larger
/// than the size threshold gets the short deadline, since a stall at that
/// point means the container trailer is all that is missing.
class Finalizer {
 public:
  Finalizer(SessionContext* session, const FinalizerConfig& config);

  // Non-copyable.
  Finalizer(const Finalizer&) = delete;
  Finalizer& operator=(const Finalizer&) = delete;

  /// Finish `encoder` writing to `path`, bounded by the deadline for the
  /// file's current size.  Marks the session's `encoding_finished` flag on
  /// every path out.  `encoder` may be null.
  FinalizeOutcome Finalize(std::unique_ptr<VideoEncoder> encoder,
                           const std::string& path);

  /// Deadline applied to an artifact of `current_size` bytes.
  std::chrono::milliseconds DeadlineFor(int64_t current_size) const;

  const ArtifactDescriptor& artifact() const { return artifact_; }

 private:
  SessionContext* session_;  // Non-owning.
  FinalizerConfig config_;
  ArtifactDescriptor artifact_;
};

}  // namespace internal
}  // namespace reelcore

#endif  // REELCORE_CORE_FINALIZER_H_
