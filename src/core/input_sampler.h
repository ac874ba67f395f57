// Copyright 2026 The reelcore Authors

#ifndef REELCORE_CORE_INPUT_SAMPLER_H_
#define REELCORE_CORE_INPUT_SAMPLER_H_

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/input_backend.h"
#include "reelcore/reelcore.h"

namespace reelcore {
namespace internal {

/// Edge-triggered primary-button state shared between the input-event
/// dispatch thread (writer) and the sampler thread (reader).
class ClickTracker {
 public:
  /// Record a press.  Returns true only on the released -> pressed edge.
  bool OnPress();

  /// Record a release.  Returns true only on the pressed -> released edge.
  bool OnRelease();

  bool is_pressed() const { return pressed_.load(std::memory_order_acquire); }

  void Reset() { pressed_.store(false, std::memory_order_release); }

 private:
  std::atomic<bool> pressed_{false};
};

/// Append-only sample buffer with a single drainer.
class InputSampleBuffer {
 public:
  void Append(const ReelCoreInputSample& sample);

  /// Copy the current contents without removing them.
  std::vector<ReelCoreInputSample> Peek() const;

  /// Move the contents out, leaving the buffer empty.
  std::vector<ReelCoreInputSample> Drain();

  /// Clear unless the buffer lock is held elsewhere for longer than
  /// `timeout`.  Returns false if the clear was skipped.
  bool TryClear(std::chrono::milliseconds timeout);

  size_t size() const;

 private:
  mutable std::timed_mutex mu_;
  std::vector<ReelCoreInputSample> samples_;
};

/// Map a platform cursor name ("left_ptr", "xterm", "hand2", ...) to the
/// closed cursor-shape set.  Unrecognized names map to kReelCoreCursorOther.
ReelCoreCursorShape ClassifyCursorName(const std::string& name);

/// Remove short cursor-shape flicker from a drained sample sequence.
///
/// Every run of identical shapes, except the first, whose duration is below
/// `min_run_seconds` takes the shape of the run immediately before it.  A
/// run lasts from its first timestamp to the first timestamp of the next
/// run (or to its own last timestamp for the final run).  Positions and
/// click state are left untouched.
void DebounceCursorShapes(std::vector<ReelCoreInputSample>* samples,
                          double min_run_seconds);

/// Samples the global pointer at a fixed cadence on a dedicated thread.
///
/// Coordinates are stored relative to the selected display's origin.  The
/// press state comes from a ClickTracker fed by the backend's input-event
/// subscription.
class InputSampler {
 public:
  /// Returns false once the owning session is no longer active.
  using ActivePredicate = std::function<bool()>;

  InputSampler(InputBackend* backend, InputSampleBuffer* buffer,
               std::chrono::milliseconds interval);
  ~InputSampler();

  // Non-copyable.
  InputSampler(const InputSampler&) = delete;
  InputSampler& operator=(const InputSampler&) = delete;

  /// Subscribe to button events and spawn the sampling thread.  Sample
  /// timestamps are seconds since `session_start`.
  /// A failed subscription is logged; sampling still runs without press
  /// state.
  bool Start(const ReelCoreDisplayInfo& display,
             std::chrono::steady_clock::time_point session_start,
             ActivePredicate is_active);

  /// Same, with the clock starting now.
  bool Start(const ReelCoreDisplayInfo& display, ActivePredicate is_active) {
    return Start(display, std::chrono::steady_clock::now(),
                 std::move(is_active));
  }

  /// Stop sampling, join the thread and drop the subscription.  Idempotent.
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

 private:
  void Run();
  void SampleOnce();

  InputBackend* backend_;       // Non-owning.
  InputSampleBuffer* buffer_;   // Non-owning.
  std::chrono::milliseconds interval_;
  ClickTracker clicks_;
  ReelCoreDisplayInfo display_ = {};
  std::chrono::steady_clock::time_point session_start_;
  ActivePredicate is_active_;
  std::string last_cursor_name_;
  ReelCoreCursorShape last_shape_ = kReelCoreCursorDefault;
  bool query_failed_logged_ = false;

  std::thread thread_;
  std::atomic<bool> running_{false};
  bool subscribed_ = false;
};

}  // namespace internal
}  // namespace reelcore

#endif  // REELCORE_CORE_INPUT_SAMPLER_H_
