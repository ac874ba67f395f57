// Copyright 2026 The reelcore Authors

#ifndef REELCORE_CORE_SESSION_CONTEXT_H_
#define REELCORE_CORE_SESSION_CONTEXT_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "core/encoder_slot.h"
#include "core/input_sampler.h"
#include "delivery/delivery_state.h"
#include "reelcore/reelcore.h"

namespace reelcore {
namespace internal {

/// Shared state of one context's recording session.
///
/// Owned by the RecordingController and handed by reference to the capture
/// worker, the finalizer and the input sampler.  Every field is either
/// atomic or guarded by its own lock, so any thread may touch it.
class SessionContext {
 public:
  /// How long Reclaim() waits for a busy sub-resource before skipping it.
  static constexpr std::chrono::milliseconds kReclaimLockTimeout{500};

  SessionContext() = default;
  ~SessionContext();

  // Non-copyable.
  SessionContext(const SessionContext&) = delete;
  SessionContext& operator=(const SessionContext&) = delete;

  // -- Status --

  ReelCoreSessionStatus status() const { return status_.load(); }
  void set_status(ReelCoreSessionStatus status) { status_.store(status); }

  /// Atomically move from `from` to `to`.  Returns false (and leaves the
  /// status alone) if the current status is not `from`.
  bool TransitionStatus(ReelCoreSessionStatus from, ReelCoreSessionStatus to);

  /// Armed, Stopping or Finalizing.
  bool IsActive() const;

  // -- Flags --

  bool stop_requested() const { return stop_requested_.load(); }
  void RequestStop() { stop_requested_.store(true); }

  bool encoder_active() const { return encoder_active_.load(); }
  void set_encoder_active(bool active) { encoder_active_.store(active); }

  bool encoding_finished() const { return encoding_finished_.load(); }

  /// Set `encoding_finished`.  Returns true for the call that actually
  /// flipped it.
  bool MarkEncodingFinished() { return !encoding_finished_.exchange(true); }

  /// Reset per-session flags and record the new artifact path.  Called by
  /// the controller right before a session is armed.
  void BeginSession(const std::string& artifact_path);

  // -- Artifact path --

  std::string artifact_path() const;

  // -- Capture error --

  /// Record a fatal capture-side failure for the next stop request.
  void RecordCaptureError(const std::string& message);
  bool has_capture_error() const;
  std::string capture_error() const;

  // -- Owned sub-resources --

  InputSampleBuffer& samples() { return samples_; }
  EncoderSlot& encoder_slot() { return encoder_slot_; }

  // -- Delivery --

  /// Replace the current delivery.  The previous one (server, mapping,
  /// chunk cursor) is torn down before `delivery` becomes visible.
  void InstallDelivery(std::unique_ptr<DeliveryState> delivery);

  /// Run `fn(DeliveryState*)` under the delivery lock.  `fn` receives
  /// nullptr when nothing is being delivered.
  template <typename Fn>
  auto WithDelivery(Fn&& fn) -> decltype(fn(nullptr)) {
    std::lock_guard<std::timed_mutex> lock(delivery_mu_);
    return fn(delivery_.get());
  }

  // -- Reclaimer --

  /// Return the session to an idle, empty state.
  ///
  /// Clears the stop flag, marks the encoder inactive, drops the delivery
  /// (server, mapping, ports), clears the input buffer and the artifact
  /// path, and sets the status to Idle.  Each step is independent: a lock
  /// that stays busy for kReclaimLockTimeout is logged and that step is
  /// skipped.  Never deletes the artifact file.  Safe to call at any time
  /// and from any thread.
  void Reclaim();

 private:
  std::atomic<ReelCoreSessionStatus> status_{kReelCoreSessionIdle};
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> encoder_active_{false};
  std::atomic<bool> encoding_finished_{false};

  mutable std::timed_mutex path_mu_;
  std::string artifact_path_;

  mutable std::mutex error_mu_;
  std::string capture_error_;

  InputSampleBuffer samples_;
  EncoderSlot encoder_slot_;

  std::timed_mutex delivery_mu_;
  std::unique_ptr<DeliveryState> delivery_;
};

}  // namespace internal
}  // namespace reelcore

#endif  // REELCORE_CORE_SESSION_CONTEXT_H_
