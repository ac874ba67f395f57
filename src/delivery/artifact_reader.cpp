// Copyright 2026 The reelcore Authors

#include "delivery/artifact_reader.h"

#include <sys/stat.h>

#include <algorithm>
#include <fstream>
#include <utility>

#include "core/logger.h"

namespace reelcore {
namespace internal {

int64_t ArtifactFileSize(const std::string& path) {
  struct stat st;
  if (path.empty() || ::stat(path.c_str(), &st) != 0) return -1;
  if (!S_ISREG(st.st_mode)) return -1;
  return static_cast<int64_t>(st.st_size);
}

ReelCoreError ReadWholeArtifact(const std::string& path,
                                std::vector<uint8_t>* out_bytes) {
  if (!out_bytes) return kReelCoreErrorInvalidParam;

  int64_t size = ArtifactFileSize(path);
  if (size <= 0) {
    REELCORE_LOG_ERROR("Artifact missing or empty: {}", path);
    return kReelCoreErrorEmptyArtifact;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    REELCORE_LOG_ERROR("Failed to open artifact: {}", path);
    return kReelCoreErrorIo;
  }

  out_bytes->resize(static_cast<size_t>(size));
  file.read(reinterpret_cast<char*>(out_bytes->data()), size);
  std::streamsize got = file.gcount();
  if (got <= 0) {
    out_bytes->clear();
    REELCORE_LOG_ERROR("Failed to read artifact: {}", path);
    return kReelCoreErrorIo;
  }
  // The file may have shrunk between stat and read.
  out_bytes->resize(static_cast<size_t>(got));

  REELCORE_LOG_INFO("Read artifact {} ({} bytes)", path, got);
  return kReelCoreOk;
}

// ---------------------------------------------------------------------------
// ChunkReader
// ---------------------------------------------------------------------------

ChunkReader::ChunkReader(std::string path, int64_t chunk_size)
    : path_(std::move(path)), chunk_size_(chunk_size > 0 ? chunk_size : 1) {}

ReelCoreError ChunkReader::GetChunk(int64_t index,
                                    std::vector<uint8_t>* out_bytes) const {
  if (!out_bytes) return kReelCoreErrorInvalidParam;
  if (index < 0) return kReelCoreErrorOutOfRange;

  int64_t size = ArtifactFileSize(path_);
  if (size < 0) {
    REELCORE_LOG_ERROR("Chunk read: artifact missing: {}", path_);
    return kReelCoreErrorIo;
  }

  // Compare by division; index * chunk_size can overflow for huge indices.
  if (size == 0 || index > (size - 1) / chunk_size_) {
    return kReelCoreErrorOutOfRange;
  }
  int64_t start = index * chunk_size_;
  int64_t length = std::min(chunk_size_, size - start);

  std::ifstream file(path_, std::ios::binary);
  if (!file) {
    REELCORE_LOG_ERROR("Chunk read: failed to open {}", path_);
    return kReelCoreErrorIo;
  }
  file.seekg(start);
  if (!file) {
    REELCORE_LOG_ERROR("Chunk read: seek to {} failed", start);
    return kReelCoreErrorIo;
  }

  out_bytes->resize(static_cast<size_t>(length));
  file.read(reinterpret_cast<char*>(out_bytes->data()), length);
  std::streamsize got = file.gcount();
  if (got <= 0) {
    out_bytes->clear();
    REELCORE_LOG_ERROR("Chunk read: read of chunk {} failed", index);
    return kReelCoreErrorIo;
  }
  out_bytes->resize(static_cast<size_t>(got));

  REELCORE_LOG_TRACE("Chunk {} -> {} bytes at offset {}", index, got, start);
  return kReelCoreOk;
}

int64_t ChunkReader::ChunkCount() const {
  int64_t size = ArtifactFileSize(path_);
  if (size <= 0) return 0;
  return (size + chunk_size_ - 1) / chunk_size_;
}

}  // namespace internal
}  // namespace reelcore
