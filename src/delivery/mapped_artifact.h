// Copyright 2026 The reelcore Authors

#ifndef REELCORE_DELIVERY_MAPPED_ARTIFACT_H_
#define REELCORE_DELIVERY_MAPPED_ARTIFACT_H_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "reelcore/reelcore.h"

namespace reelcore {
namespace internal {

/// Read-only memory-mapped view of a finished artifact.  Unmapped on
/// destruction.
class MappedArtifact {
 public:
  ~MappedArtifact();

  // Non-copyable.
  MappedArtifact(const MappedArtifact&) = delete;
  MappedArtifact& operator=(const MappedArtifact&) = delete;

  /// Map `path`, retrying up to `attempts` times with `backoff` between
  /// tries while the file is missing, empty, or cannot be opened yet (the
  /// encoder may still be releasing it).
  ///
  /// @param out_error  Receives kReelCoreErrorEmptyArtifact if the file never
  ///                   became non-empty, kReelCoreErrorMapFailed otherwise.
  /// @return nullptr on failure.
  static std::unique_ptr<MappedArtifact> Open(const std::string& path,
                                              int attempts,
                                              std::chrono::milliseconds backoff,
                                              ReelCoreError* out_error);

  const uint8_t* data() const { return static_cast<const uint8_t*>(addr_); }
  size_t size() const { return size_; }
  const std::string& path() const { return path_; }

 private:
  MappedArtifact(std::string path, void* addr, size_t size);

  std::string path_;
  void* addr_;
  size_t size_;
};

}  // namespace internal
}  // namespace reelcore

#endif  // REELCORE_DELIVERY_MAPPED_ARTIFACT_H_
