// Copyright 2026 The reelcore Authors

#ifndef REELCORE_CORE_DISPLAY_BACKEND_H_
#define REELCORE_CORE_DISPLAY_BACKEND_H_

#include <memory>
#include <vector>

#include "reelcore/reelcore.h"

namespace reelcore {
namespace internal {

/// Abstract interface for display-geometry enumeration.
class DisplayBackend {
 public:
  virtual ~DisplayBackend() = default;

  // Non-copyable.
  DisplayBackend(const DisplayBackend&) = delete;
  DisplayBackend& operator=(const DisplayBackend&) = delete;

  /// Return a fresh snapshot of the connected displays, ids 0-based in
  /// enumeration order.  Empty if no display server is reachable.
  virtual std::vector<ReelCoreDisplayInfo> ListDisplays() = 0;

 protected:
  DisplayBackend() = default;
};

/// Factory function implemented per-platform.
std::unique_ptr<DisplayBackend> CreatePlatformDisplayBackend();

}  // namespace internal
}  // namespace reelcore

#endif  // REELCORE_CORE_DISPLAY_BACKEND_H_
