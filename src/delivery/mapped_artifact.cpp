// Copyright 2026 The reelcore Authors

#include "delivery/mapped_artifact.h"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>
#include <utility>

#include "core/logger.h"

namespace reelcore {
namespace internal {

MappedArtifact::MappedArtifact(std::string path, void* addr, size_t size)
    : path_(std::move(path)), addr_(addr), size_(size) {}

MappedArtifact::~MappedArtifact() {
  if (addr_ && addr_ != MAP_FAILED) {
    ::munmap(addr_, size_);
    REELCORE_LOG_DEBUG("Unmapped artifact {}", path_);
  }
}

std::unique_ptr<MappedArtifact> MappedArtifact::Open(
    const std::string& path, int attempts, std::chrono::milliseconds backoff,
    ReelCoreError* out_error) {
  ReelCoreError error = kReelCoreErrorEmptyArtifact;
  if (attempts < 1) attempts = 1;

  for (int attempt = 1; attempt <= attempts; ++attempt) {
    if (attempt > 1) std::this_thread::sleep_for(backoff);

    struct stat st;
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode) ||
        st.st_size <= 0) {
      error = kReelCoreErrorEmptyArtifact;
      REELCORE_LOG_DEBUG("Artifact not ready (attempt {}/{}): {}", attempt,
                         attempts, path);
      continue;
    }

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
      error = kReelCoreErrorMapFailed;
      REELCORE_LOG_WARN("open({}) failed (attempt {}/{}): {}", path, attempt,
                        attempts, std::strerror(errno));
      continue;
    }

    size_t size = static_cast<size_t>(st.st_size);
    void* addr = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
    int map_errno = errno;
    ::close(fd);  // The mapping keeps its own reference.
    if (addr == MAP_FAILED) {
      error = kReelCoreErrorMapFailed;
      REELCORE_LOG_WARN("mmap({}) failed (attempt {}/{}): {}", path, attempt,
                        attempts, std::strerror(map_errno));
      continue;
    }

    REELCORE_LOG_INFO("Mapped artifact {} ({} bytes)", path, size);
    if (out_error) *out_error = kReelCoreOk;
    return std::unique_ptr<MappedArtifact>(
        new MappedArtifact(path, addr, size));
  }

  REELCORE_LOG_ERROR("Giving up mapping {} after {} attempts", path, attempts);
  if (out_error) *out_error = error;
  return nullptr;
}

}  // namespace internal
}  // namespace reelcore
