// Copyright 2026 The reelcore Authors

#ifndef REELCORE_DELIVERY_ARTIFACT_READER_H_
#define REELCORE_DELIVERY_ARTIFACT_READER_H_

#include <cstdint>
#include <string>
#include <vector>

#include "reelcore/reelcore.h"

namespace reelcore {
namespace internal {

/// Size of the file at `path` in bytes, or -1 if it does not exist or is not
/// a regular file.
int64_t ArtifactFileSize(const std::string& path);

/// Read the entire artifact into `out_bytes`.
/// @return kReelCoreErrorEmptyArtifact if the file is missing or empty,
///         kReelCoreErrorIo on a read failure.
ReelCoreError ReadWholeArtifact(const std::string& path,
                                std::vector<uint8_t>* out_bytes);

/// Pull-based fixed-size chunk access to an artifact.
///
/// Every call re-reads the file from disk, so a file that is still growing
/// is served up to its current length.
class ChunkReader {
 public:
  ChunkReader(std::string path, int64_t chunk_size);

  /// Read chunk `index`, i.e. bytes [index * chunk_size, +chunk_size).  The
  /// last chunk may be short.
  /// @return kReelCoreErrorOutOfRange when index * chunk_size >= file size.
  ReelCoreError GetChunk(int64_t index, std::vector<uint8_t>* out_bytes) const;

  /// ceil(file_size / chunk_size) for the current file size.
  int64_t ChunkCount() const;

  const std::string& path() const { return path_; }
  int64_t chunk_size() const { return chunk_size_; }

 private:
  std::string path_;
  int64_t chunk_size_;
};

}  // namespace internal
}  // namespace reelcore

#endif  // REELCORE_DELIVERY_ARTIFACT_READER_H_
