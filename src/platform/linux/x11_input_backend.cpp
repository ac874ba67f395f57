// Copyright 2026 The reelcore Authors
// Linux input backend: XQueryPointer polling plus XFixes cursor names.

#include "core/input_backend.h"

#if defined(__linux__)

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <utility>

#include <X11/Xlib.h>
#include <X11/extensions/Xfixes.h>

#include "core/logger.h"

namespace reelcore {
namespace internal {

class X11InputBackend : public InputBackend {
 public:
  X11InputBackend() = default;

  ~X11InputBackend() override {
    Unsubscribe();
    if (query_display_) XCloseDisplay(query_display_);
  }

  bool QueryPointer(PointerState* out_state) override {
    if (!out_state) return false;
    if (!query_display_ && !OpenQueryDisplay()) return false;

    Display* dpy = query_display_;
    Window root = DefaultRootWindow(dpy);
    Window root_ret = 0, child_ret = 0;
    int root_x = 0, root_y = 0, win_x = 0, win_y = 0;
    unsigned int mask = 0;
    if (!XQueryPointer(dpy, root, &root_ret, &child_ret, &root_x, &root_y,
                       &win_x, &win_y, &mask)) {
      return false;  // Pointer is on another screen.
    }
    out_state->x = root_x;
    out_state->y = root_y;
    out_state->cursor_name.clear();

    if (has_xfixes_) {
      XFixesCursorImage* cursor = XFixesGetCursorImage(dpy);
      if (cursor) {
        if (cursor->name) out_state->cursor_name = cursor->name;
        XFree(cursor);
      }
    }
    return true;
  }

  bool Subscribe(ButtonCallback on_press, ButtonCallback on_release) override {
    if (watching_.load()) return true;

    Display* dpy = XOpenDisplay(nullptr);
    if (!dpy) {
      REELCORE_LOG_WARN("Failed to open X11 display for button watcher");
      return false;
    }
    watching_.store(true);
    watcher_ = std::thread(&X11InputBackend::WatchButtons, this, dpy,
                           std::move(on_press), std::move(on_release));
    return true;
  }

  void Unsubscribe() override {
    watching_.store(false);
    if (watcher_.joinable()) watcher_.join();
  }

 private:
  static constexpr auto kButtonPollInterval = std::chrono::milliseconds(8);

  bool OpenQueryDisplay() {
    query_display_ = XOpenDisplay(nullptr);
    if (!query_display_) {
      if (!open_failed_logged_) {
        REELCORE_LOG_WARN("Failed to open X11 display for pointer queries");
        open_failed_logged_ = true;
      }
      return false;
    }
    int event_base = 0, error_base = 0;
    has_xfixes_ =
        XFixesQueryExtension(query_display_, &event_base, &error_base) != 0;
    if (!has_xfixes_) {
      REELCORE_LOG_WARN("XFixes unavailable; cursor shapes reported as other");
    }
    return true;
  }

  // Core X has no global button events without a grab, so the primary
  // button mask is polled and edges are dispatched from this thread.
  void WatchButtons(Display* dpy, ButtonCallback on_press,
                    ButtonCallback on_release) {
    Window root = DefaultRootWindow(dpy);
    bool was_down = false;
    while (watching_.load()) {
      Window root_ret = 0, child_ret = 0;
      int rx = 0, ry = 0, wx = 0, wy = 0;
      unsigned int mask = 0;
      if (XQueryPointer(dpy, root, &root_ret, &child_ret, &rx, &ry, &wx, &wy,
                        &mask)) {
        bool down = (mask & Button1Mask) != 0;
        if (down && !was_down && on_press) on_press();
        if (!down && was_down && on_release) on_release();
        was_down = down;
      }
      std::this_thread::sleep_for(kButtonPollInterval);
    }
    if (was_down && on_release) on_release();
    XCloseDisplay(dpy);
  }

  Display* query_display_ = nullptr;  // Sampler thread only.
  bool has_xfixes_ = false;
  bool open_failed_logged_ = false;

  std::thread watcher_;
  std::atomic<bool> watching_{false};
};

std::unique_ptr<InputBackend> CreatePlatformInputBackend() {
  return std::make_unique<X11InputBackend>();
}

}  // namespace internal
}  // namespace reelcore

#endif  // __linux__
