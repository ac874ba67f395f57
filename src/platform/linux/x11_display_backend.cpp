// Copyright 2026 The reelcore Authors
// Linux display enumeration: one entry per X screen.

#include "core/display_backend.h"

#if defined(__linux__)

#include <cstdio>

#include <X11/Xlib.h>

#include "core/logger.h"

namespace reelcore {
namespace internal {

class X11DisplayBackend : public DisplayBackend {
 public:
  X11DisplayBackend() = default;

  std::vector<ReelCoreDisplayInfo> ListDisplays() override {
    std::vector<ReelCoreDisplayInfo> displays;

    // A short-lived connection per snapshot; enumeration is rare.
    Display* dpy = XOpenDisplay(nullptr);
    if (!dpy) {
      REELCORE_LOG_WARN("Failed to open X11 display; no displays listed");
      return displays;
    }

    int count = ScreenCount(dpy);
    int primary = DefaultScreen(dpy);
    for (int scr = 0; scr < count; ++scr) {
      ReelCoreDisplayInfo info{};
      info.id = scr;
      info.x = 0;  // Every X screen has its own root at 0,0.
      info.y = 0;
      info.width = DisplayWidth(dpy, scr);
      info.height = DisplayHeight(dpy, scr);
      info.is_primary = (scr == primary) ? 1 : 0;
      std::snprintf(info.name, sizeof(info.name), "Screen %d", scr);
      displays.push_back(info);
    }
    XCloseDisplay(dpy);

    REELCORE_LOG_DEBUG("Enumerated {} X screen(s)", displays.size());
    return displays;
  }
};

std::unique_ptr<DisplayBackend> CreatePlatformDisplayBackend() {
  return std::make_unique<X11DisplayBackend>();
}

}  // namespace internal
}  // namespace reelcore

#endif  // __linux__
