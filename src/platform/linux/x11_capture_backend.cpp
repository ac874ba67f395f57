// Copyright 2026 The reelcore Authors

#include "platform/linux/x11_capture_backend.h"

#if defined(__linux__)

#include <algorithm>
#include <chrono>
#include <cstring>
#include <mutex>
#include <utility>
#include <vector>

#include <X11/Xlib.h>
#include <X11/Xutil.h>

#include "core/logger.h"

namespace reelcore {
namespace internal {

namespace {

std::once_flag g_error_handler_flag;

// Xlib's default handler exits the process; a failed XGetImage must only
// end the frame loop.
int LogXError(Display* dpy, XErrorEvent* event) {
  char text[256] = {};
  XGetErrorText(dpy, event->error_code, text, sizeof(text));
  REELCORE_LOG_WARN("X error {} (request {}): {}",
                    static_cast<int>(event->error_code),
                    static_cast<int>(event->request_code), text);
  return 0;
}

// Converts a ZPixmap XImage to an opaque BGRA frame.
std::unique_ptr<VideoFrame> ToVideoFrame(XImage* ximg,
                                         VideoFrame::Clock::time_point grabbed) {
  const int w = ximg->width;
  const int h = ximg->height;
  const int stride = w * VideoFrame::kBytesPerPixel;
  std::vector<uint8_t> pixels(static_cast<size_t>(stride) * h);

  // 24/32-bit TrueColor little-endian is already B G R x in memory.
  const bool native = ximg->bits_per_pixel == 32 &&
                      ximg->byte_order == LSBFirst &&
                      ximg->red_mask == 0xFF0000 &&
                      ximg->green_mask == 0x00FF00 &&
                      ximg->blue_mask == 0x0000FF;
  for (int y = 0; y < h; ++y) {
    uint8_t* dst = pixels.data() + static_cast<size_t>(y) * stride;
    if (native) {
      std::memcpy(dst, ximg->data + static_cast<size_t>(y) * ximg->bytes_per_line,
                  static_cast<size_t>(stride));
      for (int x = 0; x < w; ++x) dst[x * 4 + 3] = 0xFF;
      continue;
    }
    for (int x = 0; x < w; ++x) {
      unsigned long px = XGetPixel(ximg, x, y);
      dst[x * 4 + 0] = static_cast<uint8_t>(px & 0xFF);
      dst[x * 4 + 1] = static_cast<uint8_t>((px >> 8) & 0xFF);
      dst[x * 4 + 2] = static_cast<uint8_t>((px >> 16) & 0xFF);
      dst[x * 4 + 3] = 0xFF;
    }
  }
  return VideoFrame::Adopt(w, h, stride, std::move(pixels), grabbed);
}

}  // namespace

X11CaptureBackend::X11CaptureBackend() = default;

X11CaptureBackend::~X11CaptureBackend() {
  RequestStop();
  Join();
}

bool X11CaptureBackend::Start(const ReelCoreDisplayInfo& display, int fps,
                              FrameHandler* handler) {
  if (!handler || fps <= 0) return false;
  if (running_.load()) {
    REELCORE_LOG_WARN("X11 capture already running");
    return false;
  }
  Join();  // Reap a loop that exited on its own.

  std::call_once(g_error_handler_flag, []() { XSetErrorHandler(&LogXError); });

  Display* dpy = XOpenDisplay(nullptr);
  if (!dpy) {
    REELCORE_LOG_ERROR("Failed to open X11 display");
    return false;
  }

  int screen = display.id;
  if (screen < 0 || screen >= ScreenCount(dpy)) screen = DefaultScreen(dpy);
  int width = std::min(display.width, DisplayWidth(dpy, screen));
  int height = std::min(display.height, DisplayHeight(dpy, screen));

  stop_requested_.store(false);
  running_.store(true);
  thread_ = std::thread(&X11CaptureBackend::Run, this, dpy, screen, width,
                        height, fps, handler);
  REELCORE_LOG_INFO("X11 capture started: screen {} ({}x{}) @ {} fps", screen,
                    width, height, fps);
  return true;
}

void X11CaptureBackend::RequestStop() { stop_requested_.store(true); }

void X11CaptureBackend::Join() {
  if (thread_.joinable()) thread_.join();
}

void X11CaptureBackend::Run(void* display, int screen, int width, int height,
                            int fps, FrameHandler* handler) {
  auto* dpy = static_cast<Display*>(display);
  Window root = RootWindow(dpy, screen);
  const auto interval = std::chrono::microseconds(1000000 / fps);
  LoopControl control(&stop_requested_);

  auto next_tick = std::chrono::steady_clock::now();
  while (!stop_requested_.load()) {
    auto grabbed = std::chrono::steady_clock::now();
    XImage* ximg =
        XGetImage(dpy, root, 0, 0, static_cast<unsigned>(width),
                  static_cast<unsigned>(height), AllPlanes, ZPixmap);
    if (!ximg) {
      REELCORE_LOG_ERROR("XGetImage failed; ending capture");
      break;
    }
    auto frame = ToVideoFrame(ximg, grabbed);
    XDestroyImage(ximg);
    if (frame) handler->OnFrameArrived(*frame, &control);

    next_tick += interval;
    auto now = std::chrono::steady_clock::now();
    if (next_tick > now) {
      std::this_thread::sleep_until(next_tick);
    } else {
      next_tick = now;
    }
  }

  XCloseDisplay(dpy);
  handler->OnClosed();
  running_.store(false);
  REELCORE_LOG_INFO("X11 capture loop exited");
}

// Factory function.
std::unique_ptr<CaptureBackend> CreatePlatformCaptureBackend() {
  return std::make_unique<X11CaptureBackend>();
}

}  // namespace internal
}  // namespace reelcore

#endif  // __linux__
