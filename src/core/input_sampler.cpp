// Copyright 2026 The reelcore Authors

#include "core/input_sampler.h"

#include <algorithm>
#include <cctype>
#include <utility>

#include "core/logger.h"

namespace reelcore {
namespace internal {

// ---------------------------------------------------------------------------
// ClickTracker
// ---------------------------------------------------------------------------

bool ClickTracker::OnPress() {
  return !pressed_.exchange(true, std::memory_order_acq_rel);
}

bool ClickTracker::OnRelease() {
  return pressed_.exchange(false, std::memory_order_acq_rel);
}

// ---------------------------------------------------------------------------
// InputSampleBuffer
// ---------------------------------------------------------------------------

void InputSampleBuffer::Append(const ReelCoreInputSample& sample) {
  std::lock_guard<std::timed_mutex> lock(mu_);
  samples_.push_back(sample);
}

std::vector<ReelCoreInputSample> InputSampleBuffer::Peek() const {
  std::lock_guard<std::timed_mutex> lock(mu_);
  return samples_;
}

std::vector<ReelCoreInputSample> InputSampleBuffer::Drain() {
  std::lock_guard<std::timed_mutex> lock(mu_);
  std::vector<ReelCoreInputSample> out = std::move(samples_);
  samples_.clear();
  return out;
}

bool InputSampleBuffer::TryClear(std::chrono::milliseconds timeout) {
  std::unique_lock<std::timed_mutex> lock(mu_, std::defer_lock);
  if (!lock.try_lock_for(timeout)) return false;
  samples_.clear();
  samples_.shrink_to_fit();
  return true;
}

size_t InputSampleBuffer::size() const {
  std::lock_guard<std::timed_mutex> lock(mu_);
  return samples_.size();
}

// ---------------------------------------------------------------------------
// Cursor shape classification / debounce
// ---------------------------------------------------------------------------

namespace {

const char* const kDefaultCursorNames[] = {
    "left_ptr", "default", "arrow", "top_left_arrow", "x-cursor"};
const char* const kTextCursorNames[] = {
    "xterm", "text", "ibeam", "vertical-text"};
const char* const kPointerCursorNames[] = {
    "hand1", "hand2", "pointer", "pointing_hand", "hand"};

template <size_t N>
bool Contains(const char* const (&names)[N], const std::string& value) {
  for (const char* name : names) {
    if (value == name) return true;
  }
  return false;
}

}  // namespace

ReelCoreCursorShape ClassifyCursorName(const std::string& name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (Contains(kDefaultCursorNames, lower)) return kReelCoreCursorDefault;
  if (Contains(kTextCursorNames, lower)) return kReelCoreCursorText;
  if (Contains(kPointerCursorNames, lower)) return kReelCoreCursorPointer;
  return kReelCoreCursorOther;
}

void DebounceCursorShapes(std::vector<ReelCoreInputSample>* samples,
                          double min_run_seconds) {
  if (!samples || samples->size() < 2) return;
  auto& s = *samples;

  // Runs are delimited on the original shapes; a reclassified run hands its
  // new shape on as the predecessor of the next run.
  ReelCoreCursorShape prev_shape = s[0].cursor_shape;
  size_t run_start = 0;
  bool first_run = true;
  size_t changed = 0;

  while (run_start < s.size()) {
    const ReelCoreCursorShape shape = s[run_start].cursor_shape;
    size_t run_end = run_start + 1;
    while (run_end < s.size() && s[run_end].cursor_shape == shape) ++run_end;

    double end_ts = run_end < s.size() ? s[run_end].timestamp
                                       : s[run_end - 1].timestamp;
    double duration = end_ts - s[run_start].timestamp;

    if (!first_run && duration < min_run_seconds && shape != prev_shape) {
      for (size_t i = run_start; i < run_end; ++i) {
        s[i].cursor_shape = prev_shape;
      }
      changed += run_end - run_start;
    }

    prev_shape = s[run_start].cursor_shape;
    first_run = false;
    run_start = run_end;
  }

  if (changed > 0) {
    REELCORE_LOG_DEBUG("Cursor debounce reclassified {} of {} samples",
                       changed, s.size());
  }
}

// ---------------------------------------------------------------------------
// InputSampler
// ---------------------------------------------------------------------------

InputSampler::InputSampler(InputBackend* backend, InputSampleBuffer* buffer,
                           std::chrono::milliseconds interval)
    : backend_(backend), buffer_(buffer), interval_(interval) {}

InputSampler::~InputSampler() { Stop(); }

bool InputSampler::Start(const ReelCoreDisplayInfo& display,
                         std::chrono::steady_clock::time_point session_start,
                         ActivePredicate is_active) {
  if (!backend_ || !buffer_) return false;
  if (thread_.joinable()) {
    REELCORE_LOG_WARN("Input sampler already started");
    return false;
  }

  display_ = display;
  session_start_ = session_start;
  is_active_ = std::move(is_active);
  clicks_.Reset();
  last_cursor_name_.clear();
  last_shape_ = kReelCoreCursorDefault;
  query_failed_logged_ = false;

  subscribed_ = backend_->Subscribe(
      [this]() {
        if (clicks_.OnPress()) REELCORE_LOG_DEBUG("Mouse pressed");
      },
      [this]() {
        if (clicks_.OnRelease()) REELCORE_LOG_DEBUG("Mouse released");
      });
  if (!subscribed_) {
    REELCORE_LOG_WARN("Input event subscription failed; clicks not tracked");
  }

  running_.store(true, std::memory_order_release);
  thread_ = std::thread(&InputSampler::Run, this);
  REELCORE_LOG_INFO("Input sampler started ({}ms interval, origin {},{})",
                    interval_.count(), display_.x, display_.y);
  return true;
}

void InputSampler::Stop() {
  running_.store(false, std::memory_order_release);
  if (thread_.joinable()) {
    thread_.join();
    REELCORE_LOG_INFO("Input sampler stopped");
  }
  if (subscribed_) {
    backend_->Unsubscribe();
    subscribed_ = false;
  }
}

void InputSampler::Run() {
  auto next_tick = std::chrono::steady_clock::now();

  while (running_.load(std::memory_order_acquire)) {
    if (is_active_ && !is_active_()) break;

    SampleOnce();

    next_tick += interval_;
    auto now = std::chrono::steady_clock::now();
    if (next_tick > now) {
      std::this_thread::sleep_until(next_tick);
    } else {
      next_tick = now;  // Fell behind; don't burst.
    }
  }
  running_.store(false, std::memory_order_release);
}

void InputSampler::SampleOnce() {
  PointerState state;
  if (!backend_->QueryPointer(&state)) {
    if (!query_failed_logged_) {
      REELCORE_LOG_WARN("Pointer query failed; skipping samples");
      query_failed_logged_ = true;
    }
    return;
  }

  if (state.cursor_name != last_cursor_name_) {
    last_cursor_name_ = state.cursor_name;
    last_shape_ = ClassifyCursorName(state.cursor_name);
  }

  ReelCoreInputSample sample = {};
  sample.x = state.x - display_.x;
  sample.y = state.y - display_.y;
  // Never negative, even if the clock origin was set after this thread began.
  sample.timestamp = std::max(
      0.0, std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                         session_start_)
               .count());
  sample.is_pressed = clicks_.is_pressed() ? 1 : 0;
  sample.cursor_shape = last_shape_;
  buffer_->Append(sample);
}

}  // namespace internal
}  // namespace reelcore
